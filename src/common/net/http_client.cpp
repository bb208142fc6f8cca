// common/net/http_client.cpp
#include "common/net/http_client.h"
#include "agentgraph/core/errors.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace agentgraph {

HttpResponse HttpClient::get(const std::string& url, const HttpHeaders& headers, long timeout_sec) {
    HttpRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout_sec = timeout_sec;
    return send(request);
}

HttpResponse HttpClient::post_json(const std::string& url, const nlohmann::json& body, long timeout_sec) {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers = {{"Content-Type", "application/json"}};
    request.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    request.timeout_sec = timeout_sec;
    return send(request);
}

namespace {

struct CurlWriteCtx {
    std::string* out;
    size_t max_bytes;
};

size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = reinterpret_cast<CurlWriteCtx*>(userdata);
    size_t total = size * nmemb;
    if (ctx->max_bytes > 0 && ctx->out->size() + total > ctx->max_bytes) {
        size_t allowed = ctx->max_bytes - ctx->out->size();
        if (allowed > 0) ctx->out->append(ptr, allowed);
        return 0; // 超出上限，中止传输
    }
    ctx->out->append(ptr, total);
    return total;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    ensure_curl_global_init();
}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ExternalServiceError("curl_easy_init failed");
    }

    HttpResponse res;
    CurlWriteCtx ctx{&res.body, request.max_bytes};

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
    }
    CurlList headers(raw_headers, curl_slist_free_all);

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, request.timeout_sec);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, ""); // gzip/deflate as offered by libcurl
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    if (headers) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    }
    if (request.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode rc = curl_easy_perform(h);
    // 截断写入不视为错误
    bool truncated = rc == CURLE_WRITE_ERROR && request.max_bytes > 0 && res.body.size() >= request.max_bytes;
    if (rc != CURLE_OK && !truncated) {
        throw ExternalServiceError(request.method + " " + request.url + " failed: " + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &res.status);
    char* ct = nullptr;
    curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &ct);
    if (ct) res.content_type = ct;
    char* final_url = nullptr;
    curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &final_url);
    if (final_url) res.final_url = final_url;
    return res;
}

std::string CurlHttpClient::url_encode(std::string_view text) {
    ensure_curl_global_init();
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ExternalServiceError("curl_easy_init failed");
    }
    char* escaped = curl_easy_escape(curl.get(), text.data(), static_cast<int>(text.size()));
    if (!escaped) {
        throw ExternalServiceError("curl_easy_escape failed");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string CurlHttpClient::url_decode(std::string_view text) {
    ensure_curl_global_init();
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ExternalServiceError("curl_easy_init failed");
    }
    int out_len = 0;
    char* decoded = curl_easy_unescape(curl.get(), text.data(), static_cast<int>(text.size()), &out_len);
    if (!decoded) {
        throw ExternalServiceError("curl_easy_unescape failed");
    }
    std::string out(decoded, static_cast<size_t>(out_len));
    curl_free(decoded);
    return out;
}

std::string CurlHttpClient::with_query(const std::string& url, const QueryParams& params) {
    std::string out = url;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        out += sep;
        out += url_encode(key) + "=" + url_encode(value);
        sep = '&';
    }
    return out;
}

} // namespace agentgraph
