// common/tools/page_fetcher.cpp
#include "common/tools/page_fetcher.h"
#include "common/net/html_text.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

HttpPageFetcher::HttpPageFetcher(std::shared_ptr<HttpClient> http, long timeout_sec)
    : http_(std::move(http)), timeout_sec_(timeout_sec) {}

std::string HttpPageFetcher::fetch_text(const std::string& url, size_t max_chars) {
    try {
        HttpRequest request;
        request.url = url;
        request.timeout_sec = timeout_sec_;
        request.headers = {{"Accept", "text/html,application/xhtml+xml,text/plain;q=0.9,*/*;q=0.5"}};
        request.max_bytes = 4 * 1024 * 1024; // 原始 HTML 上限

        HttpResponse res = http_->send(request);
        if (res.status != 200) {
            return "Failed to load page (Status: " + std::to_string(res.status) + ")";
        }
        if (res.content_type.find("html") == std::string::npos && !res.content_type.empty()) {
            return truncate(collapse_whitespace(res.body), max_chars);
        }
        return html_to_text(res.body, max_chars);
    } catch (const std::exception& e) {
        spdlog::warn("fetch {} failed: {}", url, e.what());
        return std::string("Error reading page: ") + e.what();
    }
}

} // namespace agentgraph
