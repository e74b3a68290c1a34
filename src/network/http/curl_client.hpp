#pragma once
#include <curl/curl.h>
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <string>
#include "spindle/constants.hpp"
#include "spindle/http_client.hpp"

namespace Spindle {
namespace Network {
namespace Http {

/**
 * libcurl transport. curl_easy_perform blocks, so each client runs it on a
 * private single-thread pool and the calling coroutine suspends meanwhile.
 * curl_global_init must have been called before the first client is made.
 */
class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::seconds timeout) override;
    void set_max_body_bytes(std::size_t limit) override;

    boost::asio::awaitable<FetchResult> fetch(const std::string& url,
                                              const std::string& user_agent) override;

    static FetchError map_curl_code(CURLcode code);

private:
    struct RequestContext {
        std::string* body           = nullptr;
        std::string* content_type   = nullptr;
        std::size_t  max_body_bytes = 0;
        bool         over_limit     = false;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::chrono::milliseconds          connect_timeout_{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::seconds               request_timeout_{Core::Constants::REQUEST_TIMEOUT_SECONDS};
    std::size_t                        max_body_bytes_ = 0;
    boost::asio::thread_pool           pool_{1};

    FetchResult perform(const std::string& url, const std::string& user_agent);
    void        setup_curl_options(CURL*              curl,
                                   const std::string& url,
                                   const std::string& user_agent,
                                   RequestContext&    ctx) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
