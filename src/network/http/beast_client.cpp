#include "beast_client.hpp"
#include <limits>
#include "../../utils/url/link_resolver.hpp"

namespace Spindle {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

std::string connect_host(const Url& url) {
    const std::string& host = url.host();
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
        return host.substr(1, host.size() - 2);
    return host;
}

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::seconds timeout) {
    request_timeout_ = timeout;
}

void BeastClient::set_max_body_bytes(std::size_t limit) {
    max_body_bytes_ = limit;
}

bool BeastClient::is_redirect(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

FetchError BeastClient::classify(const boost::system::error_code& ec, Stage stage) {
    if (ec == beast::error::timeout)
        return FetchError::Timeout;
    if (ec == http::error::body_limit)
        return FetchError::BodyRead;
    if (ec.category() == net::error::get_ssl_category() || stage == Stage::Handshake)
        return FetchError::Tls;
    if (stage == Stage::Read)
        return FetchError::BodyRead;
    return FetchError::Connection;
}

net::awaitable<FetchResult> BeastClient::fetch(const std::string& url,
                                               const std::string& user_agent) {
    FetchResult result;
    result.effective_url = url;

    auto current = Url::parse(url);
    if (!current) {
        result.error_type = FetchError::Connection;
        result.error      = "Invalid URL";
        co_return result;
    }

    for (int redirects = 0;; ++redirects) {
        result.effective_url = current->str();

        Stage stage = Stage::Connect;
        Reply reply;
        try {
            if (current->scheme() == "https")
                reply = co_await perform_https_request(*current, user_agent, stage);
            else
                reply = co_await perform_http_request(*current, user_agent, stage);
        } catch (const boost::system::system_error& e) {
            result.error_type = classify(e.code(), stage);
            result.error      = e.code().message();
            co_return result;
        }

        result.status_code  = reply.status_code;
        result.content_type = std::move(reply.content_type);

        if (!is_redirect(reply.status_code) || reply.location.empty()) {
            result.body = std::move(reply.body);
            break;
        }

        if (redirects >= Core::Constants::MAX_REDIRECTS) {
            result.error_type = FetchError::Status;
            result.error      = "Too many redirects";
            co_return result;
        }

        LinkResult next = Utils::LinkResolver::resolve_reference(*current, reply.location);
        if (!next.ok()) {
            result.error_type = FetchError::Status;
            result.error      = "Unusable redirect location: " + reply.location;
            co_return result;
        }
        current = next.url;
    }

    if (result.status_code < 200 || result.status_code >= 300) {
        result.error_type = FetchError::Status;
        result.error      = "HTTP " + std::to_string(result.status_code);
    }
    co_return result;
}

net::awaitable<BeastClient::Reply>
BeastClient::perform_http_request(const Url& url, const std::string& user_agent, Stage& stage) {
    stage = Stage::Connect;
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(
        connect_host(url), std::to_string(url.effective_port()), net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request_timeout_);
    Reply reply = co_await exchange(stream, url, user_agent, stage);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return reply;
}

net::awaitable<BeastClient::Reply>
BeastClient::perform_https_request(const Url& url, const std::string& user_agent, Stage& stage) {
    stage                  = Stage::Connect;
    const std::string host = connect_host(url);

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results = co_await resolver.async_resolve(
        host, std::to_string(url.effective_port()), net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!is_ip_literal(host) && !SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str())) {
        stage = Stage::Handshake;
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);

    stage = Stage::Handshake;
    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);
    Reply reply = co_await exchange(ssl_stream, url, user_agent, stage);

    // Many servers close without a TLS close_notify; the reply is complete either way.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return reply;
}

template <class Stream>
net::awaitable<BeastClient::Reply> BeastClient::exchange(Stream&            stream,
                                                         const Url&         url,
                                                         const std::string& user_agent,
                                                         Stage&             stage) {
    stage = Stage::Request;
    http::request<http::empty_body> req{http::verb::get, url.target(), 11};
    req.set(http::field::host, url.authority());
    req.set(http::field::user_agent, user_agent);
    req.set(http::field::accept, "text/html,application/xhtml+xml,*/*;q=0.8");
    co_await http::async_write(stream, req, net::use_awaitable);

    stage = Stage::Read;
    beast::flat_buffer                      b;
    http::response_parser<http::string_body> parser;
    parser.body_limit(max_body_bytes_ > 0 ? static_cast<std::uint64_t>(max_body_bytes_)
                                          : std::numeric_limits<std::uint64_t>::max());
    co_await http::async_read(stream, b, parser, net::use_awaitable);

    auto& res = parser.get();

    Reply reply;
    reply.status_code = res.result_int();
    if (auto ct = res.find(http::field::content_type); ct != res.end())
        reply.content_type = std::string(ct->value());
    if (auto loc = res.find(http::field::location); loc != res.end())
        reply.location = std::string(loc->value());
    reply.body = std::move(res.body());
    co_return reply;
}

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
