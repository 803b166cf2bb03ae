#ifndef JSON_LINES_EVENT_READER_HPP
#define JSON_LINES_EVENT_READER_HPP

#include "base_event_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <string>

// One JSON event per line from a file, or stdin for "-". With live
// monitoring the reader keeps polling past EOF instead of finishing.
class JsonLinesEventReader : public IEventReader {
public:
  static constexpr size_t DEFAULT_BATCH_SIZE = 100;

  JsonLinesEventReader(const std::string &path, bool follow,
                       size_t batch_size = DEFAULT_BATCH_SIZE);
  // Reads from an existing stream; used for stdin and in tests
  JsonLinesEventReader(std::istream &input, bool follow,
                       size_t batch_size = DEFAULT_BATCH_SIZE);
  ~JsonLinesEventReader() override;

  std::vector<EventPtr> get_next_batch() override;
  bool is_exhausted() const override;

  uint64_t lines_read() const { return line_number_; }
  uint64_t malformed_lines() const { return malformed_lines_; }

private:
  std::ifstream file_stream_;
  std::istream *input_;
  std::string source_name_;
  const bool follow_;
  const size_t batch_size_;
  uint64_t line_number_ = 0;
  uint64_t malformed_lines_ = 0;
  bool exhausted_ = false;
};

#endif // JSON_LINES_EVENT_READER_HPP
