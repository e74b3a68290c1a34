#pragma once
#include "spindle/crawl_config.hpp"
#include "spindle/http_client.hpp"

namespace Spindle {
namespace Network {
namespace Http {

// Builds a fresh client per call; each crawl worker owns the one it gets.
ClientFactory make_client_factory(Transport transport);

}  // namespace Http
}  // namespace Network
}  // namespace Spindle
