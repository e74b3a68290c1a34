#include <gtest/gtest.h>
#include <sstream>
#include "../../src/core/report/report.hpp"

using namespace Spindle;
using namespace Spindle::Core;

namespace {

PageResult sample_page() {
    PageResult result;
    result.url            = *Url::parse("https://example.com/a");
    result.referrer       = *Url::parse("https://example.com/");
    result.depth          = 1;
    result.effective_url  = "https://example.com/a/";
    result.status_code    = 200;
    result.content_type   = "text/html";
    result.body           = "<html></html>";
    result.links_found    = 4;
    result.links_enqueued = 2;
    return result;
}

}  // namespace

TEST(ReportTest, FormatNames) {
    EXPECT_EQ(parse_report_format("text"), ReportFormat::Text);
    EXPECT_EQ(parse_report_format("jsonl"), ReportFormat::JsonLines);
    EXPECT_THROW(parse_report_format("xml"), std::invalid_argument);
}

TEST(ReportTest, PageToJson) {
    nlohmann::json j = sample_page();
    EXPECT_EQ(j["url"], "https://example.com/a");
    EXPECT_EQ(j["referrer"], "https://example.com/");
    EXPECT_EQ(j["effective_url"], "https://example.com/a/");
    EXPECT_EQ(j["status"], 200);
    EXPECT_EQ(j["bytes"], 13);
    EXPECT_EQ(j["links_found"], 4);
    EXPECT_EQ(j["links_enqueued"], 2);
    EXPECT_FALSE(j.contains("error"));
}

TEST(ReportTest, FailedPageToJson) {
    PageResult result;
    result.url         = *Url::parse("https://example.com/missing");
    result.status_code = 404;
    result.error_type  = FetchError::Status;
    result.error       = "HTTP 404";

    nlohmann::json j = result;
    EXPECT_EQ(j["error_type"], "status");
    EXPECT_EQ(j["error"], "HTTP 404");
    EXPECT_FALSE(j.contains("referrer"));
    EXPECT_FALSE(j.contains("links_found"));
}

TEST(ReportTest, JsonLinesOutput) {
    std::ostringstream out;
    Report             report(out, ReportFormat::JsonLines);

    CrawlSummary summary;
    summary.pages_fetched = 3;
    summary.errors        = 1;

    report.page(sample_page());
    report.summary(summary);

    std::istringstream lines(out.str());
    std::string        line;
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(nlohmann::json::parse(line)["url"], "https://example.com/a");
    ASSERT_TRUE(std::getline(lines, line));
    auto last = nlohmann::json::parse(line);
    EXPECT_EQ(last["summary"]["pages_fetched"], 3);
    EXPECT_EQ(last["summary"]["errors"], 1);
    EXPECT_EQ(last["summary"]["cancelled"], false);
    EXPECT_FALSE(std::getline(lines, line));
}

TEST(ReportTest, JsonLinesSurvivesInvalidUtf8) {
    PageResult result    = sample_page();
    result.effective_url = "https://example.com/\xff\xfe";
    result.content_type  = "text/html; charset=\xc3";

    std::ostringstream out;
    Report             report(out, ReportFormat::JsonLines);
    report.page(result);

    std::string line = out.str();
    ASSERT_FALSE(line.empty());
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["url"], "https://example.com/a");
    EXPECT_EQ(j["effective_url"], "https://example.com/\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(ReportTest, TextOutput) {
    std::ostringstream out;
    Report             report(out, ReportFormat::Text);
    report.page(sample_page());
    EXPECT_EQ(out.str(), "200 https://example.com/a depth=1 links=4 new=2\n");
}
