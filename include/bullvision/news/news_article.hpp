#pragma once

#include <bullvision/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bullvision {

// ---------------------------------------------------------------------------
// NewsArticle — one news item surfaced by a news-search tool during a turn.
// ---------------------------------------------------------------------------
struct NewsArticle {
    std::string title;
    std::string url;
    std::string content;
    double score = 0.0;
    std::optional<std::string> published_at;
    std::optional<std::string> summary;
    std::optional<std::string> source;
    bool notified = false;
    std::string created_at;   // ISO-8601 UTC, set when extracted
};

/// Identity key used for idempotent storage: the URL when present,
/// otherwise "source|title|published_at".
std::string NewsKey(const NewsArticle& article);

nlohmann::json NewsArticleToJson(const NewsArticle& article);

/// Fails with ErrorCategory::Storage unless `j` is an object with string
/// "title" and "url".
Result<NewsArticle, Error> NewsArticleFromJson(const nlohmann::json& j);

/// Collect the articles in a tools/call result. Each text content block is
/// parsed as JSON (an array of items or a single item); every item's
/// "results" entries become articles. Malformed blocks and entries are
/// skipped with a warning.
std::vector<NewsArticle> ExtractNewsArticles(const nlohmann::json& call_result);

} // namespace bullvision
