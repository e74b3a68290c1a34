#include "client_factory.hpp"
#include "beast_client.hpp"
#include "curl_client.hpp"

namespace Spindle {
namespace Network {
namespace Http {

ClientFactory make_client_factory(Transport transport) {
    if (transport == Transport::Curl) {
        return []() -> std::unique_ptr<HttpClient> { return std::make_unique<CurlClient>(); };
    }
    return []() -> std::unique_ptr<HttpClient> { return std::make_unique<BeastClient>(); };
}

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
