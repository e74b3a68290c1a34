#include "curl_client.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <string_view>
#include "../../utils/text/string_utils.hpp"

namespace Spindle {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";
constexpr std::string_view STATUS_LINE_PREFIX  = "HTTP/";

}  // namespace

FetchError CurlClient::map_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return FetchError::None;
        case CURLE_OPERATION_TIMEDOUT:
            return FetchError::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return FetchError::Tls;
        case CURLE_WRITE_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_FILESIZE_EXCEEDED:
        case CURLE_BAD_CONTENT_ENCODING:
            return FetchError::BodyRead;
        case CURLE_TOO_MANY_REDIRECTS:
            return FetchError::Status;
        default:
            return FetchError::Connection;
    }
}

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    if (ctx->max_body_bytes > 0 && ctx->body->size() + total > ctx->max_body_bytes) {
        ctx->over_limit = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

// Called for the headers of every response in a redirect chain; the last
// response's Content-Type wins.
size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*            ctx = static_cast<CurlClient::RequestContext*>(userp);
    size_t           len = size * nitems;
    std::string_view header(buffer, len);
    if (!ctx || !ctx->content_type)
        return len;

    if (Utils::Text::starts_with(header, STATUS_LINE_PREFIX)) {
        ctx->content_type->clear();
        return len;
    }
    if (header.size() < CONTENT_TYPE_HEADER.size()
        || !Utils::Text::iequals(header.substr(0, CONTENT_TYPE_HEADER.size()), CONTENT_TYPE_HEADER))
        return len;

    *ctx->content_type = Utils::Text::trim(header.substr(CONTENT_TYPE_HEADER.size()));
    return len;
}

CurlClient::CurlClient() : curl_(curl_easy_init()) {
}

void CurlClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void CurlClient::set_request_timeout(std::chrono::seconds timeout) {
    request_timeout_ = timeout;
}

void CurlClient::set_max_body_bytes(std::size_t limit) {
    max_body_bytes_ = limit;
}

void CurlClient::setup_curl_options(CURL*              curl,
                                    const std::string& url,
                                    const std::string& user_agent,
                                    RequestContext&    ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(Core::Constants::MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request_timeout_.count()));
    if (max_body_bytes_ > 0)
        curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_body_bytes_));
    if (!user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
}

FetchResult CurlClient::perform(const std::string& url, const std::string& user_agent) {
    FetchResult result;
    result.effective_url = url;
    if (!curl_) {
        result.error_type = FetchError::Connection;
        result.error      = "Failed to initialize CURL handle";
        return result;
    }

    RequestContext ctx{&result.body, &result.content_type, max_body_bytes_};
    setup_curl_options(curl_.get(), url, user_agent, ctx);

    CURLcode code = curl_easy_perform(curl_.get());

    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &result.status_code);
    char* effective = nullptr;
    curl_easy_getinfo(curl_.get(), CURLINFO_EFFECTIVE_URL, &effective);
    if (effective)
        result.effective_url = effective;

    if (code != CURLE_OK) {
        result.body.clear();
        result.error_type = ctx.over_limit ? FetchError::BodyRead : map_curl_code(code);
        result.error      = ctx.over_limit ? "Body exceeds " + std::to_string(max_body_bytes_)
                                                 + " bytes"
                                           : curl_easy_strerror(code);
        return result;
    }

    if (result.status_code < 200 || result.status_code >= 300) {
        result.error_type = FetchError::Status;
        result.error      = "HTTP " + std::to_string(result.status_code);
    }
    return result;
}

boost::asio::awaitable<FetchResult> CurlClient::fetch(const std::string& url,
                                                      const std::string& user_agent) {
    co_return co_await boost::asio::co_spawn(
        pool_,
        [this, url, user_agent]() -> boost::asio::awaitable<FetchResult> {
            co_return perform(url, user_agent);
        },
        boost::asio::use_awaitable);
}

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
