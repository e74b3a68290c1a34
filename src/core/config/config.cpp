#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"
#include "../logger/logger.hpp"

namespace Spindle {
namespace Core {

namespace {

ScopePolicy scope_from_name(const std::string& name) {
    if (name == "host")
        return ScopePolicy::SameHost;
    if (name == "domain")
        return ScopePolicy::SameDomain;
    if (name == "any")
        return ScopePolicy::Any;
    throw std::invalid_argument("Unknown scope: " + name + " (expected host, domain or any)");
}

PolitenessMode politeness_from_name(const std::string& name) {
    if (name == "global")
        return PolitenessMode::Global;
    if (name == "host")
        return PolitenessMode::PerHost;
    if (name == "worker")
        return PolitenessMode::PerWorker;
    throw std::invalid_argument("Unknown politeness mode: " + name
                                + " (expected global, host or worker)");
}

Transport transport_from_name(const std::string& name) {
    if (name == "beast")
        return Transport::Beast;
    if (name == "curl")
        return Transport::Curl;
    throw std::invalid_argument("Unknown transport: " + name + " (expected beast or curl)");
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["concurrency"])
            config.concurrency = yaml["concurrency"].as<int>();
        if (yaml["delay_ms"])
            config.delay_ms = yaml["delay_ms"].as<int>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["scope"])
            config.scope = yaml["scope"].as<std::string>();
        if (yaml["politeness"])
            config.politeness = yaml["politeness"].as<std::string>();
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["max_body_bytes"])
            config.max_body_bytes = yaml["max_body_bytes"].as<std::size_t>();
        if (yaml["connect_timeout_ms"])
            config.connect_timeout_ms = yaml["connect_timeout_ms"].as<int>();
        if (yaml["timeout_s"])
            config.timeout_s = yaml["timeout_s"].as<int>();
        if (yaml["transport"])
            config.transport = yaml["transport"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
        if (yaml["format"])
            config.format = yaml["format"].as<std::string>();

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }

        if (yaml["seed_file"])
            config.seed_file = yaml["seed_file"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

void load_seed_file(Config& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open seed file: " + path);

    std::string line;
    while (std::getline(file, line)) {
        std::string url = Utils::Text::strip_comment(line);
        if (!url.empty())
            config.urls.push_back(std::move(url));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Spindle - Concurrent web crawler"};
    app.set_version_flag("--version", std::string(Constants::VERSION));

    app.add_option("-c,--concurrency", config.concurrency, "Concurrent fetch workers (0 = auto)");
    app.add_option("--delay", config.delay_ms, "Minimum milliseconds between request starts");
    app.add_option("-A,--user-agent", config.user_agent, "User-Agent header");
    app.add_option("--scope", config.scope, "Link scope: host, domain or any");
    app.add_option("--politeness", config.politeness, "Delay scope: global, host or worker");
    app.add_option("-d,--depth", config.depth, "Maximum link depth (-1 = unlimited)");
    app.add_option("--max-body-bytes", config.max_body_bytes, "Response body limit (0 = none)");
    app.add_option("--connect-timeout", config.connect_timeout_ms, "Connect timeout in ms");
    app.add_option("--timeout", config.timeout_s, "Request timeout in seconds");
    app.add_option("--transport", config.transport, "HTTP transport: beast or curl");
    app.add_option("--log-level", config.log_level, "none, error, warn, success, info or all");
    app.add_option("--format", config.format, "Report format: text or jsonl");
    app.add_option("--seed-file", config.seed_file, "File with one seed URL per line");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag(
        "-q,--quiet",
        [&](size_t count) {
            if (count > 0)
                config.log_level = "error";
        },
        "Only log errors");

    app.add_option("urls", config.urls, "Seed URLs");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command-line values win over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!config.seed_file.empty())
        load_seed_file(config, config.seed_file);

    return config;
}

CrawlConfig Config::to_crawl_config() const {
    CrawlConfig crawl;
    if (concurrency != 0)
        crawl.concurrency = concurrency;
    crawl.delay           = std::chrono::milliseconds(delay_ms);
    crawl.user_agent      = user_agent;
    crawl.scope           = scope_from_name(scope);
    crawl.politeness      = politeness_from_name(politeness);
    crawl.max_depth       = depth;
    crawl.max_body_bytes  = max_body_bytes;
    crawl.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    crawl.request_timeout = std::chrono::seconds(timeout_s);
    crawl.transport       = transport_from_name(transport);
    return crawl;
}

int Config::log_mask() const {
    return Logger::parse_level(log_level);
}

}  // namespace Core
}  // namespace Spindle
