#include "spindle/http_client.hpp"
#include "spindle/observer.hpp"

namespace Spindle {

const char* to_string(FetchError error) {
    switch (error) {
        case FetchError::None: return "none";
        case FetchError::Connection: return "connection";
        case FetchError::Timeout: return "timeout";
        case FetchError::Tls: return "tls";
        case FetchError::Status: return "status";
        case FetchError::BodyRead: return "body-read";
    }
    return "unknown";
}

const char* to_string(LinkError error) {
    switch (error) {
        case LinkError::None: return "none";
        case LinkError::Malformed: return "malformed";
        case LinkError::Unsupported: return "unsupported";
        case LinkError::OutOfScope: return "out-of-scope";
    }
    return "unknown";
}

}  // namespace Spindle
