#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <curl/curl.h>
#include <iostream>
#include <thread>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/report/report.hpp"
#include "engine/crawler/crawler.hpp"

namespace {

using namespace Spindle;
using Spindle::Core::Logger;

class ReportingObserver : public CrawlObserver {
public:
    explicit ReportingObserver(Core::Report& report) : report_(report) {
    }

    void on_page_result(const PageResult& result) override {
        report_.page(result);
    }

private:
    Core::Report& report_;
};

// Turns SIGINT/SIGTERM into a cooperative crawler shutdown while alive.
class SignalWatcher {
public:
    explicit SignalWatcher(Engine::Crawler& crawler) : signals_(ioc_, SIGINT, SIGTERM) {
        signals_.async_wait([&crawler](const boost::system::error_code& error, int signal_number) {
            if (!error) {
                Logger::info("Signal " + std::to_string(signal_number)
                             + " received. Shutting down...");
                crawler.shutdown();
            }
        });
        thread_ = std::thread([this]() { ioc_.run(); });
    }

    ~SignalWatcher() {
        ioc_.stop();
        if (thread_.joinable())
            thread_.join();
    }

private:
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    std::thread             thread_;
};

int run_crawler(const Core::Config& config) {
    Core::Report report(std::cout, Core::parse_report_format(config.format));
    CrawlConfig  crawl_config = config.to_crawl_config();
    crawl_config.observer     = std::make_shared<ReportingObserver>(report);

    curl_global_init(CURL_GLOBAL_ALL);
    int exit_code = 0;
    try {
        Engine::Crawler crawler(crawl_config);
        SignalWatcher   watcher(crawler);
        report.summary(crawler.start(config.urls));
    } catch (const std::invalid_argument& e) {
        Logger::error("Invalid configuration: " + std::string(e.what()));
        exit_code = 2;
    }
    curl_global_cleanup();
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Spindle::Core::Config::parse(argc, argv);
        Logger::set_level(config.log_mask());

        if (config.urls.empty()) {
            Logger::error("No URLs provided. Pass seed URLs or --seed-file.");
            return 1;
        }
        return run_crawler(config);
    } catch (const std::invalid_argument& e) {
        Logger::error("Invalid configuration: " + std::string(e.what()));
        return 2;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
