// common/tools/search_provider.cpp
#include "common/tools/search_provider.h"
#include "agentgraph/core/errors.h"
#include "common/net/html_text.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentgraph {

void to_json(nlohmann::json& j, const SearchResult& r) {
    j = nlohmann::json{{"title", r.title}, {"url", r.url}, {"snippet", r.snippet}};
}

void from_json(const nlohmann::json& j, SearchResult& r) {
    r.title = j.value("title", "");
    r.url = j.value("url", "");
    r.snippet = j.value("snippet", "");
}

namespace {

nlohmann::json parse_body(const HttpResponse& res, const std::string& provider) {
    if (res.status < 200 || res.status >= 300) {
        throw ExternalServiceError(provider + " search returned status " + std::to_string(res.status));
    }
    auto data = nlohmann::json::parse(res.body, nullptr, false);
    if (data.is_discarded()) {
        throw ExternalServiceError(provider + " search returned invalid JSON");
    }
    return data;
}

} // namespace

// --- Brave ---

BraveSearchProvider::BraveSearchProvider(std::shared_ptr<HttpClient> http, std::string api_key, long timeout_sec)
    : http_(std::move(http)), api_key_(std::move(api_key)), timeout_sec_(timeout_sec) {}

std::vector<SearchResult> BraveSearchProvider::search(const std::string& query, int max_results) {
    if (api_key_.empty()) {
        throw ExternalServiceError("Brave API key not provided");
    }
    const std::string url = CurlHttpClient::with_query(
        "https://api.search.brave.com/res/v1/web/search",
        {{"q", query}, {"count", std::to_string(max_results)}});
    HttpHeaders headers = {
        {"Accept", "application/json"},
        {"X-Subscription-Token", api_key_},
    };
    auto data = parse_body(http_->get(url, headers, timeout_sec_), name());

    std::vector<SearchResult> results;
    if (data.contains("web") && data["web"].contains("results")) {
        for (const auto& item : data["web"]["results"]) {
            results.push_back({item.value("title", ""), item.value("url", ""), item.value("description", "")});
        }
    }
    return results;
}

// --- Google Custom Search ---

GoogleSearchProvider::GoogleSearchProvider(std::shared_ptr<HttpClient> http, std::string api_key,
                                           std::string cse_id, long timeout_sec)
    : http_(std::move(http)), api_key_(std::move(api_key)), cse_id_(std::move(cse_id)), timeout_sec_(timeout_sec) {}

std::vector<SearchResult> GoogleSearchProvider::search(const std::string& query, int max_results) {
    if (api_key_.empty() || cse_id_.empty()) {
        throw ExternalServiceError("Google API key or CSE ID not provided");
    }
    // API 限制 num <= 10
    const int num = std::max(1, std::min(max_results, 10));
    const std::string url = CurlHttpClient::with_query(
        "https://www.googleapis.com/customsearch/v1",
        {{"q", query}, {"key", api_key_}, {"cx", cse_id_}, {"num", std::to_string(num)}});
    auto data = parse_body(http_->get(url, {}, timeout_sec_), name());

    std::vector<SearchResult> results;
    if (data.contains("items")) {
        for (const auto& item : data["items"]) {
            results.push_back({item.value("title", ""), item.value("link", ""), item.value("snippet", "")});
        }
    }
    return results;
}

// --- DuckDuckGo (HTML endpoint) ---

DuckDuckGoSearchProvider::DuckDuckGoSearchProvider(std::shared_ptr<HttpClient> http, long timeout_sec)
    : http_(std::move(http)), timeout_sec_(timeout_sec) {}

std::vector<SearchResult> DuckDuckGoSearchProvider::search(const std::string& query, int max_results) {
    const std::string url = CurlHttpClient::with_query("https://html.duckduckgo.com/html/", {{"q", query}});
    HttpResponse res = http_->get(url, {}, timeout_sec_);
    if (res.status != 200) {
        throw ExternalServiceError("duckduckgo search returned status " + std::to_string(res.status));
    }
    return parse_results(res.body, max_results);
}

std::vector<SearchResult> DuckDuckGoSearchProvider::parse_results(const std::string& html, int max_results) {
    std::vector<SearchResult> results;
    std::vector<std::string> snippets = html_texts_by_class(html, "result__snippet");

    size_t snippet_idx = 0;
    for (const auto& link : html_links(html)) {
        if ((" " + link.css_class + " ").find(" result__a ") == std::string::npos) continue;
        if (static_cast<int>(results.size()) >= max_results) break;

        // 结果链接形如 //duckduckgo.com/l/?uddg=<encoded>&rut=...
        std::string target = link.href;
        size_t pos = target.find("uddg=");
        if (pos != std::string::npos) {
            size_t end = target.find('&', pos);
            target = CurlHttpClient::url_decode(
                target.substr(pos + 5, end == std::string::npos ? std::string::npos : end - pos - 5));
        }
        std::string snippet = snippet_idx < snippets.size() ? snippets[snippet_idx] : "";
        ++snippet_idx;
        results.push_back({link.text, target, snippet});
    }
    return results;
}

// --- FallbackSearchChain ---

FallbackSearchChain::FallbackSearchChain(std::vector<std::shared_ptr<SearchProvider>> providers)
    : providers_(std::move(providers)) {}

std::vector<SearchResult> FallbackSearchChain::search(const std::string& query, int max_results) {
    for (const auto& provider : providers_) {
        try {
            return provider->search(query, max_results);
        } catch (const std::exception& e) {
            spdlog::warn("{} search failed for '{}': {}", provider->name(), query, e.what());
        }
    }
    spdlog::warn("all search providers failed for '{}'", query);
    return {};
}

} // namespace agentgraph
