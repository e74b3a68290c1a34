#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

namespace Spindle {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_CONCURRENCY_PER_CORE = 1;
    static constexpr int         UNLIMITED_DEPTH              = -1;
    static constexpr const char* VERSION                      = "0.3.0";

    static constexpr int         REQUEST_TIMEOUT_SECONDS    = 10;
    static constexpr int         CONNECT_TIMEOUT_MS         = 5000;
    static constexpr int         MAX_REDIRECTS              = 5;
    static constexpr const char* USER_AGENT = "Spindle/1.0 (+https://github.com/spindle-crawler)";

    static constexpr std::size_t MIN_BODY_LIMIT_BYTES = 1024 * 1024;
    static constexpr std::size_t MAX_URL_LENGTH       = 8192;

    static constexpr int FRONTIER_POLL_INTERVAL_MS = 20;
    static constexpr int VISITED_SET_SHARDS        = 32;
};

inline int hardware_parallelism() {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<int>(hw);
}

inline int default_concurrency() {
    return std::max(1, hardware_parallelism() * Constants::DEFAULT_CONCURRENCY_PER_CORE);
}

// Non-zero limits below the floor are raised to it; zero disables the limit.
inline std::size_t effective_body_limit(std::size_t requested) {
    if (requested == 0)
        return 0;
    return std::max(requested, Constants::MIN_BODY_LIMIT_BYTES);
}

inline const std::vector<std::string>& get_html_mime_types() {
    static const std::vector<std::string> types = {"text/html", "application/xhtml+xml"};
    return types;
}

inline bool is_html_content_type(const std::string& content_type) {
    if (content_type.empty())
        return true;

    std::string lower = content_type;
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& mime : get_html_mime_types()) {
        if (lower.find(mime) != std::string::npos)
            return true;
    }
    return false;
}

}  // namespace Core
}  // namespace Spindle
