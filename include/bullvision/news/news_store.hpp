#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/news/news_article.hpp>

#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bullvision {

// ---------------------------------------------------------------------------
// INewsStore — idempotent persistence of news artifacts.
// ---------------------------------------------------------------------------
class INewsStore {
public:
    INewsStore() = default;
    virtual ~INewsStore() = default;

    INewsStore(const INewsStore&) = delete;
    INewsStore& operator=(const INewsStore&) = delete;

    /// Store the article unless one with the same NewsKey exists.
    /// Returns true when it was inserted.
    [[nodiscard]] virtual Result<bool, Error> InsertIfNew(const NewsArticle& article) = 0;
};

// ---------------------------------------------------------------------------
// JsonlNewsStore — append-only JSON-lines file, one article per line.
//
// Existing keys are loaded on Open(); unreadable lines are skipped with a
// warning so one corrupt record does not lose the rest.
// ---------------------------------------------------------------------------
class JsonlNewsStore : public INewsStore {
public:
    static Result<std::unique_ptr<JsonlNewsStore>, Error> Open(const std::string& path);

    [[nodiscard]] Result<bool, Error> InsertIfNew(const NewsArticle& article) override;

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] bool Contains(const std::string& key) const;

private:
    JsonlNewsStore(std::string path, std::ofstream out, std::set<std::string> keys);

    std::string path_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    std::set<std::string> keys_;
};

/// Insert each article in order; returns the ones that were new. Stops at
/// the first storage failure.
Result<std::vector<NewsArticle>, Error> StoreArticles(
    INewsStore& store, const std::vector<NewsArticle>& articles);

} // namespace bullvision
