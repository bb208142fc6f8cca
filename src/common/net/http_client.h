#ifndef AGENTGRAPH_COMMON_NET_HTTP_CLIENT_H
#define AGENTGRAPH_COMMON_NET_HTTP_CLIENT_H

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace agentgraph {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
    long timeout_sec = 30;
    size_t max_bytes = 0; // 0 表示不限制
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;
    std::string final_url;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Transport failures (DNS, timeout, refused) throw ExternalServiceError.
    // Non-2xx statuses are returned, not thrown.
    virtual HttpResponse send(const HttpRequest& request) = 0;

    HttpResponse get(const std::string& url, const HttpHeaders& headers = {}, long timeout_sec = 30);
    HttpResponse post_json(const std::string& url, const nlohmann::json& body, long timeout_sec = 30);
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "agentgraph/1.0");

    HttpResponse send(const HttpRequest& request) override;

    static std::string url_encode(std::string_view text);
    static std::string url_decode(std::string_view text);
    static std::string with_query(const std::string& url, const QueryParams& params);

private:
    std::string user_agent_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_NET_HTTP_CLIENT_H
