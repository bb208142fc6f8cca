#ifndef AGENTGRAPH_COMMON_TOOLS_SEARCH_PROVIDER_H
#define AGENTGRAPH_COMMON_TOOLS_SEARCH_PROVIDER_H

#include "common/net/http_client.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

struct SearchResult {
    std::string title;
    std::string url;
    std::string snippet;

    bool operator==(const SearchResult& other) const {
        return title == other.title && url == other.url && snippet == other.snippet;
    }
};

void to_json(nlohmann::json& j, const SearchResult& r);
void from_json(const nlohmann::json& j, SearchResult& r);

class SearchProvider {
public:
    virtual ~SearchProvider() = default;
    virtual std::string name() const = 0;
    // Throws ExternalServiceError on any failure (missing key, transport, bad status).
    virtual std::vector<SearchResult> search(const std::string& query, int max_results) = 0;
};

class BraveSearchProvider : public SearchProvider {
public:
    BraveSearchProvider(std::shared_ptr<HttpClient> http, std::string api_key, long timeout_sec = 10);
    std::string name() const override { return "brave"; }
    std::vector<SearchResult> search(const std::string& query, int max_results) override;

private:
    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
    long timeout_sec_;
};

class GoogleSearchProvider : public SearchProvider {
public:
    GoogleSearchProvider(std::shared_ptr<HttpClient> http, std::string api_key, std::string cse_id, long timeout_sec = 10);
    std::string name() const override { return "google"; }
    std::vector<SearchResult> search(const std::string& query, int max_results) override;

private:
    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
    std::string cse_id_;
    long timeout_sec_;
};

// Scrapes the DuckDuckGo HTML endpoint (no key required).
class DuckDuckGoSearchProvider : public SearchProvider {
public:
    explicit DuckDuckGoSearchProvider(std::shared_ptr<HttpClient> http, long timeout_sec = 10);
    std::string name() const override { return "duckduckgo"; }
    std::vector<SearchResult> search(const std::string& query, int max_results) override;

    // Exposed for tests: parses a result page.
    static std::vector<SearchResult> parse_results(const std::string& html, int max_results);

private:
    std::shared_ptr<HttpClient> http_;
    long timeout_sec_;
};

// Provider k+1 is asked only when provider k throws; all failing yields an empty list.
class FallbackSearchChain : public SearchProvider {
public:
    explicit FallbackSearchChain(std::vector<std::shared_ptr<SearchProvider>> providers);
    std::string name() const override { return "fallback"; }
    std::vector<SearchResult> search(const std::string& query, int max_results) override;

    const std::vector<std::shared_ptr<SearchProvider>>& providers() const { return providers_; }

private:
    std::vector<std::shared_ptr<SearchProvider>> providers_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_SEARCH_PROVIDER_H
