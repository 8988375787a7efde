#include "core/DetectionReport.hpp"
#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"
#include "utils/TimeUtils.hpp"

#include <gtest/gtest.h>
#include <cstdint>
#include <sstream>
#include <string>

using namespace Sentinel;
using Report::ConsoleReporter;
using Report::JsonReporter;

class ReporterTest : public ::testing::Test {
protected:
  void SetUp() override {
    report.setProcessedFile(std::string("metrics.log"));
    report.recordBatch(ts(2000));
    report.recordBatch(ts(0));
    report.recordMalformedLine();

    const core::Anomaly tokens("llm.tokens.total", 9000.0, 9.9, 1700.0, core::Direction::High,
                               core::Severity::Sev1, 500.0, 50.0, 501.0, ts(0));
    const core::Anomaly latency("llm.latency.ms", 8000.0, 4.8, 2566.7, core::Direction::High,
                                core::Severity::Sev2, 300.0, 40.0, 299.0, ts(0));
    const core::Anomaly quiet("llm.response.length", 10.0, -3.2, -99.2, core::Direction::Low,
                              core::Severity::Sev3, 1200.0, 500.0, 1190.0, ts(2000));
    report.addAnomaly(quiet);
    report.addAnomaly(latency);
    report.addAnomaly(tokens);
    report.addPattern(core::Pattern("high_token_latency_spike",
                                    "High token count causing increased latency",
                                    {latency, tokens},
                                    {"llm.latency.ms", "llm.tokens.total"},
                                    core::Severity::Sev1, core::MatchConfidence::High,
                                    ts(0), ts(0)));

    Detection::RegistrySummary summary;
    summary.totalDatapoints = 4;
    summary.totalAnomalies = 3;
    summary.totalPatterns = 1;
    summary.metricsTracked = 1;
    Detection::MetricStats stats;
    stats.metricName = "llm.tokens.total";
    stats.count = 2;
    stats.windowSize = 2;
    summary.perMetric.push_back(stats);
    report.setSummary(summary);
  }

  static Utils::TimePoint ts(std::int64_t offsetMs) {
    return Utils::fromMillisSinceEpoch(1736935200000 + offsetMs);
  }

  core::DetectionReport report;
};

TEST_F(ReporterTest, ReportTracksStreamRange) {
  EXPECT_EQ(report.batchesProcessed(), 2u);
  EXPECT_EQ(report.malformedLines(), 1u);
  EXPECT_EQ(report.analysisStart(), ts(0));
  EXPECT_EQ(report.analysisEnd(), ts(2000));
  EXPECT_EQ(report.anomalyCount(core::Severity::Sev1), 1u);
  EXPECT_EQ(report.anomalyCount(core::Severity::Sev3), 1u);
}

TEST_F(ReporterTest, ConsoleStreamsAnomalyLine) {
  std::ostringstream out;
  ConsoleReporter console(ConsoleReporter::Verbosity::NORMAL, out);
  console.reportAnomaly(report.anomalies().back());

  const std::string text = out.str();
  EXPECT_NE(text.find("[SEV-1] llm.tokens.total = 9000.0000"), std::string::npos);
  EXPECT_NE(text.find("z=+9.90"), std::string::npos);
  EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST_F(ReporterTest, ConsoleStreamsPattern) {
  std::ostringstream out;
  ConsoleReporter console(ConsoleReporter::Verbosity::NORMAL, out);
  console.reportPattern(report.patterns().front());

  const std::string text = out.str();
  EXPECT_NE(text.find("PATTERN high_token_latency_spike (high confidence)"), std::string::npos);
  EXPECT_NE(text.find("metrics: llm.latency.ms, llm.tokens.total"), std::string::npos);
}

TEST_F(ReporterTest, ConsoleFullReport) {
  std::ostringstream out;
  ConsoleReporter console(ConsoleReporter::Verbosity::VERBOSE, out);
  console.generateReport(report);

  const std::string text = out.str();
  EXPECT_NE(text.find("=== LLM SENTINEL REPORT ==="), std::string::npos);
  EXPECT_NE(text.find("File:           metrics.log"), std::string::npos);
  EXPECT_NE(text.find("(SEV-1: 1, SEV-2: 1, SEV-3: 1)"), std::string::npos);
  EXPECT_NE(text.find("high_token_latency_spike"), std::string::npos);
  EXPECT_NE(text.find("Anomalies (showing 3 of 3)"), std::string::npos);
  EXPECT_NE(text.find("=== END REPORT ==="), std::string::npos);
}

TEST_F(ReporterTest, ConsoleQuietPrintsOnlySummary) {
  std::ostringstream out;
  ConsoleReporter console(ConsoleReporter::Verbosity::QUIET, out);
  console.reportAnomaly(report.anomalies().front());
  console.generateReport(report);

  EXPECT_EQ(out.str(), "SUMMARY: 2 batches, 4 datapoints, 3 anomalies, 1 patterns\n");
}

TEST_F(ReporterTest, JsonOrdersBySeverityAndUsesLabels) {
  JsonReporter json;
  json.generateReport(report);
  const std::string text = json.getJsonString();

  EXPECT_NE(text.find("\"processedFile\":\"metrics.log\""), std::string::npos);
  EXPECT_NE(text.find("\"anomalyCount\":3"), std::string::npos);
  EXPECT_NE(text.find("\"severity\":\"SEV-1\""), std::string::npos);
  EXPECT_NE(text.find("\"patternId\":\"high_token_latency_spike\""), std::string::npos);
  EXPECT_NE(text.find("\"confidence\":\"high\""), std::string::npos);
  EXPECT_NE(text.find("\"malformedLines\":1"), std::string::npos);

  const auto first = text.find("\"metric\":\"llm.tokens.total\",\"value\"");
  const auto last = text.find("\"metric\":\"llm.response.length\"");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(last, std::string::npos);
  EXPECT_LT(first, last);
}

TEST_F(ReporterTest, JsonSeverityFilterAndCap) {
  JsonReporter json;
  json.setMinSeverity(core::Severity::Sev2);
  json.generateReport(report);
  EXPECT_NE(json.getJsonString().find("\"anomalyCount\":2"), std::string::npos);

  json.setMaxAnomalies(1);
  json.generateReport(report);
  EXPECT_NE(json.getJsonString().find("\"anomalyCount\":1"), std::string::npos);
}

TEST(SeverityLabelTest, ParsesReportLabels) {
  for (const auto sev : {core::Severity::Sev1, core::Severity::Sev2, core::Severity::Sev3})
    EXPECT_EQ(core::parseSeverity(core::severityLabel(sev)), sev);

  EXPECT_FALSE(core::parseSeverity("SEV-4"));
  EXPECT_FALSE(core::parseSeverity("sev1"));
  EXPECT_FALSE(core::parseSeverity(""));
}

TEST_F(ReporterTest, JsonEscapesStrings) {
  JsonReporter json;
  const core::Anomaly odd("weird\"name\n", 1.0, 3.5, 0.0, core::Direction::High,
                          core::Severity::Sev3, 0.0, 1.0, 0.0, ts(0));
  const std::string text = json.anomalyToJson(odd);
  EXPECT_NE(text.find("\"metric\":\"weird\\\"name\\n\""), std::string::npos);
  EXPECT_NE(text.find("\"direction\":\"high\""), std::string::npos);
}

TEST_F(ReporterTest, PrettyJsonPutsRecordsOnTheirOwnLines) {
  JsonReporter json(JsonReporter::PrettyPrint::PRETTY);
  json.generateReport(report);
  const std::string text = json.getJsonString();
  EXPECT_EQ(text.front(), '{');
  EXPECT_NE(text.find("\n  \"anomalies\": [\n    {"), std::string::npos);
  EXPECT_EQ(text.back(), '\n');
}
