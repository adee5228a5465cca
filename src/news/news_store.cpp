#include <bullvision/news/news_store.hpp>

#include <bullvision/core/log.hpp>

#include <filesystem>

namespace bullvision {

namespace {

Error StorageError(const std::string& operation, const std::string& path,
                   const std::string& message) {
    return Error::Make(ErrorCategory::Storage, operation, path, message);
}

} // anonymous namespace

JsonlNewsStore::JsonlNewsStore(std::string path, std::ofstream out,
                               std::set<std::string> keys)
    : path_(std::move(path)), out_(std::move(out)), keys_(std::move(keys)) {}

Result<std::unique_ptr<JsonlNewsStore>, Error> JsonlNewsStore::Open(const std::string& path) {
    using R = Result<std::unique_ptr<JsonlNewsStore>, Error>;

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return R::Err(StorageError("Open", path,
                                       "Cannot create directory: " + ec.message()));
        }
    }

    std::set<std::string> keys;
    {
        std::ifstream in(path);
        std::string line;
        std::size_t line_no = 0;
        while (in && std::getline(in, line)) {
            ++line_no;
            if (line.empty()) continue;
            nlohmann::json j;
            try {
                j = nlohmann::json::parse(line);
            } catch (const nlohmann::json::parse_error&) {
                LogWarn("news", path + ":" + std::to_string(line_no) +
                                    ": unreadable record skipped");
                continue;
            }
            auto article = NewsArticleFromJson(j);
            if (article.IsErr()) {
                LogWarn("news", path + ":" + std::to_string(line_no) + ": " +
                                    article.Error().message);
                continue;
            }
            keys.insert(NewsKey(article.Value()));
        }
    }

    std::ofstream out(path, std::ios::app);
    if (!out) {
        return R::Err(StorageError("Open", path, "Cannot open news store for appending"));
    }
    LogInfo("news", "Opened " + path + " (" + std::to_string(keys.size()) + " articles)");
    return R::Ok(std::unique_ptr<JsonlNewsStore>(
        new JsonlNewsStore(path, std::move(out), std::move(keys))));
}

Result<bool, Error> JsonlNewsStore::InsertIfNew(const NewsArticle& article) {
    const auto key = NewsKey(article);
    std::lock_guard<std::mutex> lock(mutex_);
    if (keys_.count(key) > 0) {
        return Result<bool, Error>::Ok(false);
    }
    out_ << NewsArticleToJson(article).dump(-1, ' ', false,
                                            nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        return Result<bool, Error>::Err(
            StorageError("InsertIfNew", path_, "Write failed for '" + article.url + "'"));
    }
    keys_.insert(key);
    return Result<bool, Error>::Ok(true);
}

std::size_t JsonlNewsStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

bool JsonlNewsStore::Contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.count(key) > 0;
}

Result<std::vector<NewsArticle>, Error> StoreArticles(
    INewsStore& store, const std::vector<NewsArticle>& articles) {
    std::vector<NewsArticle> inserted;
    for (const auto& article : articles) {
        auto result = store.InsertIfNew(article);
        if (result.IsErr()) {
            return Result<std::vector<NewsArticle>, Error>::Err(result.Error());
        }
        if (result.Value()) {
            inserted.push_back(article);
        }
    }
    if (!inserted.empty()) {
        LogInfo("news", "Stored " + std::to_string(inserted.size()) + " new article(s)");
    }
    return Result<std::vector<NewsArticle>, Error>::Ok(std::move(inserted));
}

} // namespace bullvision
