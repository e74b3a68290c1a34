#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "spindle/constants.hpp"
#include "spindle/http_client.hpp"
#include "spindle/url.hpp"

namespace Spindle {
namespace Network {
namespace Http {

/**
 * HTTP/1.1 GET over Boost.Beast, plain or TLS, one connection per request.
 * Follows up to MAX_REDIRECTS redirects and reports the final URL.
 */
class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::seconds timeout) override;
    void set_max_body_bytes(std::size_t limit) override;

    boost::asio::awaitable<FetchResult> fetch(const std::string& url,
                                              const std::string& user_agent) override;

    static bool is_redirect(long status);

private:
    enum class Stage { Connect, Handshake, Request, Read };

    struct Reply {
        long        status_code = 0;
        std::string content_type;
        std::string location;
        std::string body;
    };

    std::chrono::milliseconds connect_timeout_{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::seconds      request_timeout_{Core::Constants::REQUEST_TIMEOUT_SECONDS};
    std::size_t               max_body_bytes_ = 0;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::asio::awaitable<Reply> perform_http_request(const Url&         url,
                                                       const std::string& user_agent,
                                                       Stage&             stage);
    boost::asio::awaitable<Reply> perform_https_request(const Url&         url,
                                                        const std::string& user_agent,
                                                        Stage&             stage);

    template <class Stream>
    boost::asio::awaitable<Reply> exchange(Stream&            stream,
                                           const Url&         url,
                                           const std::string& user_agent,
                                           Stage&             stage);

    static FetchError classify(const boost::system::error_code& ec, Stage stage);
};

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
