#ifndef AGENTGRAPH_COMMON_TOOLS_PAGE_FETCHER_H
#define AGENTGRAPH_COMMON_TOOLS_PAGE_FETCHER_H

#include "common/net/http_client.h"
#include <memory>
#include <string>

namespace agentgraph {

class PageFetcher {
public:
    virtual ~PageFetcher() = default;
    // Cleaned page text; failures come back as a descriptive string, never as an exception.
    virtual std::string fetch_text(const std::string& url, size_t max_chars) = 0;
};

class HttpPageFetcher : public PageFetcher {
public:
    explicit HttpPageFetcher(std::shared_ptr<HttpClient> http, long timeout_sec = 15);
    std::string fetch_text(const std::string& url, size_t max_chars) override;

private:
    std::shared_ptr<HttpClient> http_;
    long timeout_sec_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_PAGE_FETCHER_H
