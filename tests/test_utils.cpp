#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <filesystem>

// --- Tests for split_string ---
TEST(UtilsTest, SplitString) {
  auto parts = Utils::split_string("security,system,application", ',');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "security");
  EXPECT_EQ(parts[2], "application");

  EXPECT_TRUE(Utils::split_string("", ',').empty());
  EXPECT_EQ(Utils::split_string("single", ',').size(), 1u);
}

// --- Tests for parse_iso8601_to_ms ---
TEST(UtilsTest, ParseIso8601) {
  auto utc = Utils::parse_iso8601_to_ms("2023-01-01T12:00:01Z");
  ASSERT_TRUE(utc.has_value());
  EXPECT_EQ(*utc, 1672574401000ULL);

  // 08:30 -05:00 is 13:30 UTC
  auto offset = Utils::parse_iso8601_to_ms("2025-05-23T08:30:00-05:00");
  ASSERT_TRUE(offset.has_value());
  EXPECT_EQ(*offset, 1748007000000ULL);

  auto millis = Utils::parse_iso8601_to_ms("2023-01-01T12:00:01.250Z");
  ASSERT_TRUE(millis.has_value());
  EXPECT_EQ(*millis, 1672574401250ULL);

  // Space separator, no zone means UTC
  auto spaced = Utils::parse_iso8601_to_ms("2023-01-01 12:00:01");
  ASSERT_TRUE(spaced.has_value());
  EXPECT_EQ(*spaced, 1672574401000ULL);

  auto date_only = Utils::parse_iso8601_to_ms("2023-01-01");
  ASSERT_TRUE(date_only.has_value());
  EXPECT_EQ(*date_only, 1672531200000ULL);
}

TEST(UtilsTest, ParseIso8601RejectsGarbage) {
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("").has_value());
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("not a time").has_value());
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("12:00:01").has_value());
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("2023-13-01T00:00:00Z").has_value());
  EXPECT_FALSE(Utils::parse_iso8601_to_ms("2023-01-01T12:00:01Zjunk").has_value());
}

TEST(UtilsTest, FormatIso8601) {
  EXPECT_EQ(Utils::format_iso8601_ms(1672574401123ULL),
            "2023-01-01T12:00:01.123Z");
  EXPECT_EQ(Utils::format_iso8601_ms(0), "1970-01-01T00:00:00.000Z");

  auto parsed = Utils::parse_iso8601_to_ms(
      Utils::format_iso8601_ms(1748007000042ULL));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, 1748007000042ULL);
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("4625"), 4625);
  EXPECT_EQ(Utils::string_to_number<uint64_t>("30000"), 30000u);
  EXPECT_FALSE(Utils::string_to_number<int>("46x").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("").has_value());
  EXPECT_FALSE(Utils::string_to_number<uint32_t>("-1").has_value());
}

// --- Tests for string helpers ---
TEST(UtilsTest, LowerAndTrim) {
  EXPECT_EQ(Utils::to_lower("Security"), "security");
  EXPECT_EQ(Utils::trim_copy("  4625 \t"), "4625");
  EXPECT_EQ(Utils::trim_copy("   "), "");

  std::string s = "\n value \n";
  Utils::trim_inplace(s);
  EXPECT_EQ(s, "value");
}

TEST(UtilsTest, CreateDirectoryForFile) {
  auto dir = std::filesystem::temp_directory_path() / "ce_utils_test" / "nested";
  std::filesystem::remove_all(dir.parent_path());

  EXPECT_TRUE(Utils::create_directory_for_file((dir / "out.jsonl").string()));
  EXPECT_TRUE(std::filesystem::is_directory(dir));
  // Bare file names need no directory
  EXPECT_TRUE(Utils::create_directory_for_file("out.jsonl"));

  std::filesystem::remove_all(dir.parent_path());
}

TEST(UtilsTest, SystemClockIsMonotonicEnough) {
  Utils::Clock clock = Utils::system_clock_ms();
  uint64_t first = clock();
  uint64_t second = clock();
  EXPECT_GT(first, 1600000000000ULL);
  EXPECT_GE(second, first);
}
