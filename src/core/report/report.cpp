#include "report.hpp"
#include <stdexcept>

namespace Spindle {

void to_json(nlohmann::json& j, const PageResult& result) {
    j = nlohmann::json{{"url", result.url.str()},
                       {"depth", result.depth},
                       {"status", result.status_code}};

    if (!result.referrer.empty())
        j["referrer"] = result.referrer.str();
    if (!result.effective_url.empty() && result.effective_url != result.url.str())
        j["effective_url"] = result.effective_url;

    if (result.ok()) {
        j["content_type"]   = result.content_type;
        j["bytes"]          = result.body.size();
        j["links_found"]    = result.links_found;
        j["links_enqueued"] = result.links_enqueued;
    }
    else {
        j["error_type"] = to_string(result.error_type);
        j["error"]      = result.error;
    }
}

void to_json(nlohmann::json& j, const CrawlSummary& summary) {
    j = nlohmann::json{{"pages_fetched", summary.pages_fetched},
                       {"errors", summary.errors},
                       {"unique_urls", summary.unique_urls},
                       {"links_found", summary.links_found},
                       {"cancelled", summary.cancelled},
                       {"elapsed_ms", summary.elapsed.count()}};
}

namespace Core {

namespace {

// Header values and error text come off the wire and need not be UTF-8.
std::string dump_line(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

ReportFormat parse_report_format(const std::string& name) {
    if (name == "text")
        return ReportFormat::Text;
    if (name == "jsonl")
        return ReportFormat::JsonLines;
    throw std::invalid_argument("unknown output format: " + name);
}

void Report::page(const PageResult& result) {
    if (format_ == ReportFormat::JsonLines) {
        out_ << dump_line(nlohmann::json(result)) << '\n';
        return;
    }

    if (result.ok()) {
        out_ << result.status_code << ' ' << result.url << " depth=" << result.depth
             << " links=" << result.links_found << " new=" << result.links_enqueued << '\n';
    }
    else {
        out_ << "ERR " << to_string(result.error_type) << ' ' << result.url << ": "
             << result.error << '\n';
    }
}

void Report::summary(const CrawlSummary& summary) {
    if (format_ == ReportFormat::JsonLines) {
        out_ << dump_line(nlohmann::json{{"summary", summary}}) << '\n';
        return;
    }

    out_ << "\nPages fetched: " << summary.pages_fetched << "\nErrors:        " << summary.errors
         << "\nUnique URLs:   " << summary.unique_urls << "\nLinks found:   "
         << summary.links_found << "\nElapsed:       " << summary.elapsed.count() << "ms"
         << (summary.cancelled ? " (cancelled)" : "") << '\n';
}

}  // namespace Core
}  // namespace Spindle
