#include "input/FileReader.hpp"
#include "input/MetricParser.hpp"
#include "utils/TimeUtils.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace Sentinel;
using Input::MetricParser;

class MetricParserTest : public ::testing::Test {
protected:
  MetricParser parser;
};

TEST_F(MetricParserTest, ParsesTwoTokenTimestamp) {
  const auto batch = parser.parseLine("2025-01-15 10:00:00 llm.tokens.total=512 llm.latency.ms=240.5");
  ASSERT_TRUE(batch);
  EXPECT_EQ(batch->timestamp, *Utils::parseTimestamp("2025-01-15 10:00:00"));
  ASSERT_EQ(batch->metrics.size(), 2u);
  EXPECT_EQ(batch->metrics[0].first, "llm.tokens.total");
  EXPECT_DOUBLE_EQ(batch->metrics[0].second, 512.0);
  EXPECT_EQ(batch->metrics[1].first, "llm.latency.ms");
  EXPECT_DOUBLE_EQ(batch->metrics[1].second, 240.5);
}

TEST_F(MetricParserTest, ParsesIsoAndUnixTimestamps) {
  const auto iso = parser.parseLine("2025-01-15T10:00:01 llm.tokens.total=498");
  ASSERT_TRUE(iso);
  EXPECT_EQ(iso->timestamp, *Utils::parseTimestamp("2025-01-15 10:00:01"));

  const auto epoch = parser.parseLine("1736935200 llm.cost.per_request=0.0004");
  ASSERT_TRUE(epoch);
  EXPECT_EQ(Utils::to_time_t(epoch->timestamp), 1736935200);
  EXPECT_DOUBLE_EQ(epoch->metrics.front().second, 0.0004);
}

TEST_F(MetricParserTest, SkipsBlankAndCommentLines) {
  const auto blank = parser.parseLineDetailed("   ");
  EXPECT_TRUE(blank.skipped);
  EXPECT_FALSE(blank.malformed);

  const auto comment = parser.parseLineDetailed("# recorded 2025-01-15");
  EXPECT_TRUE(comment.skipped);
  EXPECT_FALSE(comment.batch);
}

TEST_F(MetricParserTest, ReportsMalformedLines) {
  const char *bad[] = {
      "2025-13-15 10:00:00 a=1",
      "2025-01-15 10:00:00",
      "2025-01-15 10:00:00 a",
      "2025-01-15 10:00:00 =4",
      "2025-01-15 10:00:00 a=fast",
      "2025-01-15 10:00:00 a=nan",
      "2025-01-15 10:00:00 a=1 a=2",
      "17369x5200 a=1",
  };
  for (const char *line : bad) {
    const auto r = parser.parseLineDetailed(line);
    EXPECT_TRUE(r.malformed) << line;
    EXPECT_FALSE(r.skipped) << line;
    EXPECT_FALSE(r.batch) << line;
    EXPECT_FALSE(r.error.empty()) << line;
  }
}

TEST_F(MetricParserTest, DuplicateMetricNamesTheMetric) {
  const auto r = parser.parseLineDetailed("1736935200 llm.latency.ms=1 llm.latency.ms=2");
  ASSERT_TRUE(r.malformed);
  EXPECT_NE(r.error.find("llm.latency.ms"), std::string::npos);
}

TEST_F(MetricParserTest, AcceptsNegativeAndExponentValues) {
  const auto batch = parser.parseLine("1736935200 delta=-3.5 tiny=1e-5");
  ASSERT_TRUE(batch);
  EXPECT_DOUBLE_EQ(batch->metrics[0].second, -3.5);
  EXPECT_DOUBLE_EQ(batch->metrics[1].second, 1e-5);
}

TEST(FileReaderTest, ReadsLinesWithNumbers) {
  const auto path = std::filesystem::temp_directory_path() / "sentinel_reader_test.log";
  {
    std::ofstream out(path);
    out << "first\r\n\nthird\n";
  }

  Input::FileReader reader(path.string());
  ASSERT_TRUE(reader.isOpen());
  EXPECT_EQ(*reader.nextLine(), "first");
  EXPECT_EQ(reader.lineNumber(), 1u);
  EXPECT_EQ(*reader.nextLine(), "");
  EXPECT_EQ(*reader.nextLine(), "third");
  EXPECT_EQ(reader.lineNumber(), 3u);
  EXPECT_FALSE(reader.nextLine());

  ASSERT_TRUE(reader.rewind());
  EXPECT_EQ(*reader.nextLine(), "first");
  EXPECT_EQ(reader.lineNumber(), 1u);

  reader.close();
  std::filesystem::remove(path);
}

TEST(FileReaderTest, MissingFileIsNotOpen) {
  Input::FileReader reader("/nonexistent/sentinel/metrics.log");
  EXPECT_FALSE(reader.isOpen());
  EXPECT_FALSE(reader.nextLine());
}
