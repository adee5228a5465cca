#include <bullvision/news/news_article.hpp>

#include <bullvision/core/log.hpp>

#include <chrono>
#include <ctime>

namespace bullvision {

namespace {

std::string NowIso8601() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

void CollectFromItem(const nlohmann::json& item, const std::string& created_at,
                     std::vector<NewsArticle>& out) {
    if (!item.is_object()) return;
    auto results = item.find("results");
    if (results == item.end() || !results->is_array()) return;

    for (const auto& entry : *results) {
        auto article = NewsArticleFromJson(entry);
        if (article.IsErr()) {
            LogWarn("news", "Skipping news entry: " + article.Error().message);
            continue;
        }
        auto a = std::move(article).Value();
        a.created_at = created_at;
        out.push_back(std::move(a));
    }
}

} // anonymous namespace

std::string NewsKey(const NewsArticle& article) {
    if (!article.url.empty()) {
        return article.url;
    }
    return article.source.value_or("") + "|" + article.title + "|" +
           article.published_at.value_or("");
}

nlohmann::json NewsArticleToJson(const NewsArticle& article) {
    nlohmann::json j = {
        {"title", article.title},
        {"url", article.url},
        {"content", article.content},
        {"score", article.score},
        {"notified", article.notified},
        {"created_at", article.created_at},
    };
    j["published_at"] = article.published_at ? nlohmann::json(*article.published_at)
                                             : nlohmann::json();
    j["summary"] = article.summary ? nlohmann::json(*article.summary) : nlohmann::json();
    j["source"] = article.source ? nlohmann::json(*article.source) : nlohmann::json();
    return j;
}

Result<NewsArticle, Error> NewsArticleFromJson(const nlohmann::json& j) {
    auto invalid = [](const std::string& why) {
        return Result<NewsArticle, Error>::Err(
            Error::Make(ErrorCategory::Storage, "NewsArticle", "", why));
    };
    if (!j.is_object()) {
        return invalid("entry is not an object");
    }
    auto title = OptionalString(j, "title");
    auto url = OptionalString(j, "url");
    if (!title || title->empty()) return invalid("entry has no title");
    if (!url || url->empty()) return invalid("entry '" + *title + "' has no url");

    NewsArticle a;
    a.title = *title;
    a.url = *url;
    a.content = OptionalString(j, "content").value_or("");
    auto score = j.find("score");
    if (score != j.end() && score->is_number()) {
        a.score = score->get<double>();
    }
    a.published_at = OptionalString(j, "published_at");
    a.summary = OptionalString(j, "summary");
    a.source = OptionalString(j, "source");
    auto notified = j.find("notified");
    a.notified = notified != j.end() && notified->is_boolean() && notified->get<bool>();
    a.created_at = OptionalString(j, "created_at").value_or("");
    return Result<NewsArticle, Error>::Ok(std::move(a));
}

std::vector<NewsArticle> ExtractNewsArticles(const nlohmann::json& call_result) {
    std::vector<NewsArticle> out;
    if (!call_result.is_object()) return out;
    auto content = call_result.find("content");
    if (content == call_result.end() || !content->is_array()) return out;

    const auto created_at = NowIso8601();
    for (const auto& block : *content) {
        if (!block.is_object() || OptionalString(block, "type") != "text") continue;
        auto text = OptionalString(block, "text");
        if (!text) continue;

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(*text);
        } catch (const nlohmann::json::parse_error& e) {
            LogWarn("news", std::string("Tool text is not JSON, no articles taken: ") + e.what());
            continue;
        }

        if (parsed.is_array()) {
            for (const auto& item : parsed) {
                CollectFromItem(item, created_at, out);
            }
        } else {
            CollectFromItem(parsed, created_at, out);
        }
    }
    return out;
}

} // namespace bullvision
