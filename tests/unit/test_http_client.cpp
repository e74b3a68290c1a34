#include <gtest/gtest.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <curl/curl.h>
#include "../../src/network/http/beast_client.hpp"
#include "../../src/network/http/client_factory.hpp"
#include "../../src/network/http/curl_client.hpp"

using namespace Spindle;
using namespace Spindle::Network::Http;

namespace {

FetchResult fetch_sync(HttpClient& client, const std::string& url) {
    boost::asio::io_context ioc;
    FetchResult             result;
    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await client.fetch(url, "Spindle-Test/1.0");
        },
        boost::asio::detached);
    ioc.run();
    return result;
}

}  // namespace

TEST(HttpClientTest, FetchErrorNames) {
    EXPECT_STREQ(to_string(FetchError::None), "none");
    EXPECT_STREQ(to_string(FetchError::Timeout), "timeout");
    EXPECT_STREQ(to_string(FetchError::BodyRead), "body-read");
}

TEST(HttpClientTest, RedirectStatuses) {
    for (long status : {301L, 302L, 303L, 307L, 308L})
        EXPECT_TRUE(BeastClient::is_redirect(status)) << status;
    for (long status : {200L, 304L, 404L, 500L})
        EXPECT_FALSE(BeastClient::is_redirect(status)) << status;
}

TEST(HttpClientTest, CurlCodeMapping) {
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_OK), FetchError::None);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_OPERATION_TIMEDOUT), FetchError::Timeout);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_SSL_CONNECT_ERROR), FetchError::Tls);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_PEER_FAILED_VERIFICATION), FetchError::Tls);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_FILESIZE_EXCEEDED), FetchError::BodyRead);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_COULDNT_CONNECT), FetchError::Connection);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_COULDNT_RESOLVE_HOST), FetchError::Connection);
    EXPECT_EQ(CurlClient::map_curl_code(CURLE_TOO_MANY_REDIRECTS), FetchError::Status);
}

TEST(HttpClientTest, FactoryBuildsRequestedTransport) {
    auto beast = make_client_factory(Transport::Beast)();
    auto curl  = make_client_factory(Transport::Curl)();
    EXPECT_NE(dynamic_cast<BeastClient*>(beast.get()), nullptr);
    EXPECT_NE(dynamic_cast<CurlClient*>(curl.get()), nullptr);

    // Each call yields an independent client.
    auto factory = make_client_factory(Transport::Beast);
    EXPECT_NE(factory().get(), factory().get());
}

TEST(HttpClientTest, StateManagement) {
    BeastClient client;
    client.set_connect_timeout(std::chrono::milliseconds(250));
    client.set_request_timeout(std::chrono::seconds(3));
    client.set_max_body_bytes(2 * 1024 * 1024);

    CurlClient curl;
    curl.set_connect_timeout(std::chrono::milliseconds(250));
    curl.set_request_timeout(std::chrono::seconds(3));
    curl.set_max_body_bytes(0);
}

TEST(HttpClientTest, BeastRejectsInvalidUrl) {
    BeastClient client;
    auto        result = fetch_sync(client, "not a url");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_type, FetchError::Connection);
}

TEST(HttpClientTest, BeastReportsRefusedConnection) {
    BeastClient client;
    client.set_connect_timeout(std::chrono::milliseconds(500));
    auto result = fetch_sync(client, "http://127.0.0.1:1/");
    EXPECT_EQ(result.error_type, FetchError::Connection);
    EXPECT_EQ(result.status_code, 0);
    EXPECT_FALSE(result.error.empty());
}
