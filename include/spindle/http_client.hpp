#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace Spindle {

enum class FetchError { None, Connection, Timeout, Tls, Status, BodyRead };

const char* to_string(FetchError error);

struct FetchResult {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    FetchError  error_type = FetchError::None;

    bool ok() const {
        return error_type == FetchError::None;
    }
};

namespace Network {
namespace Http {

/**
 * Transport capability consumed by the crawl engine. One instance is owned
 * by each worker, so implementations need not be thread-safe. Non-2xx final
 * responses must be reported as FetchError::Status with the status code set.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/) {
    }
    virtual void set_request_timeout(std::chrono::seconds /*timeout*/) {
    }
    virtual void set_max_body_bytes(std::size_t /*limit*/) {
    }

    virtual boost::asio::awaitable<FetchResult> fetch(const std::string& url,
                                                      const std::string& user_agent) = 0;
};

using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
