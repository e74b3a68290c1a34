#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "spindle/constants.hpp"
#include "spindle/crawl_config.hpp"

namespace Spindle {
namespace Core {

struct Config {
    int                      concurrency        = 0;  // 0 = derive from hardware
    int                      delay_ms           = 0;
    std::string              user_agent         = Constants::USER_AGENT;
    std::string              scope              = "domain";
    std::string              politeness         = "global";
    int                      depth              = Constants::UNLIMITED_DEPTH;
    std::size_t              max_body_bytes     = 0;
    int                      connect_timeout_ms = Constants::CONNECT_TIMEOUT_MS;
    int                      timeout_s          = Constants::REQUEST_TIMEOUT_SECONDS;
    std::string              transport          = "beast";
    std::string              log_level          = "info";
    std::string              format             = "text";
    std::vector<std::string> urls;
    std::string              seed_file;
    std::string              config_path;

    // Exits the process on --help, --version or a command-line error;
    // throws std::runtime_error for unreadable YAML or seed files.
    static Config parse(int argc, char* argv[]);

    // Throws std::invalid_argument for unknown scope, politeness or
    // transport names.
    CrawlConfig to_crawl_config() const;
    int         log_mask() const;
};

void load_yaml(Config& config, const std::string& path);
void load_seed_file(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Spindle
