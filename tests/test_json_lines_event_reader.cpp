#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "io/event_readers/json_lines_event_reader.hpp"

TEST(JsonLinesEventReaderTest, ReadsEventsAndSkipsBadLines) {
  std::istringstream input(
      R"({"id":"e1","event_id":4625,"source":"security","timestamp":1700000000000})"
      "\n"
      "\n"
      "this is not json\n"
      R"({"source":"security"})"
      "\n"
      R"({"id":"e2","eventType":"4624","source":"security","user_name":"alice"})"
      "\n");
  JsonLinesEventReader reader(input, false);

  auto batch = reader.get_next_batch();
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[0]->id, "e1");
  EXPECT_EQ(batch[0]->event_type, "4625");
  EXPECT_EQ(batch[1]->user_name, std::optional<std::string>("alice"));

  EXPECT_EQ(reader.lines_read(), 5u);
  EXPECT_EQ(reader.malformed_lines(), 2u);
  EXPECT_TRUE(reader.is_exhausted());
  EXPECT_TRUE(reader.get_next_batch().empty());
}

TEST(JsonLinesEventReaderTest, HonoursBatchSize) {
  std::istringstream input(
      R"({"id":"a","event_id":"1","source":"s"})" "\n"
      R"({"id":"b","event_id":"1","source":"s"})" "\n"
      R"({"id":"c","event_id":"1","source":"s"})" "\n");
  JsonLinesEventReader reader(input, false, 2);

  EXPECT_EQ(reader.get_next_batch().size(), 2u);
  EXPECT_FALSE(reader.is_exhausted());

  auto rest = reader.get_next_batch();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(rest[0]->id, "c");
  EXPECT_TRUE(reader.is_exhausted());
}

TEST(JsonLinesEventReaderTest, FollowModeKeepsPollingAfterEof) {
  std::stringstream input;
  input << R"({"id":"a","event_id":"1","source":"s"})" << "\n";
  JsonLinesEventReader reader(input, true);

  EXPECT_EQ(reader.get_next_batch().size(), 1u);
  EXPECT_FALSE(reader.is_exhausted());
  EXPECT_TRUE(reader.get_next_batch().empty());

  input << R"({"id":"b","event_id":"1","source":"s"})" << "\n";
  auto batch = reader.get_next_batch();
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch[0]->id, "b");
  EXPECT_FALSE(reader.is_exhausted());
}

TEST(JsonLinesEventReaderTest, MissingFileThrows) {
  EXPECT_THROW(JsonLinesEventReader("does/not/exist.jsonl", false),
               std::runtime_error);
}
