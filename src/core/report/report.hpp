#pragma once
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

#include "spindle/crawl_config.hpp"
#include "spindle/observer.hpp"

namespace Spindle {

void to_json(nlohmann::json& j, const PageResult& result);
void to_json(nlohmann::json& j, const CrawlSummary& summary);

namespace Core {

enum class ReportFormat { Text, JsonLines };

// Throws std::invalid_argument for anything but "text" or "jsonl".
ReportFormat parse_report_format(const std::string& name);

class Report {
public:
    Report(std::ostream& out, ReportFormat format) : out_(out), format_(format) {
    }

    void page(const PageResult& result);
    void summary(const CrawlSummary& summary);

private:
    std::ostream& out_;
    ReportFormat  format_;
};

}  // namespace Core
}  // namespace Spindle
