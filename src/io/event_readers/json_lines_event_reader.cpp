#include "json_lines_event_reader.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

JsonLinesEventReader::JsonLinesEventReader(const std::string &path,
                                           bool follow, size_t batch_size)
    : input_(&std::cin), source_name_(path), follow_(follow),
      batch_size_(batch_size == 0 ? DEFAULT_BATCH_SIZE : batch_size) {
  if (path != "-") {
    file_stream_.open(path);
    if (!file_stream_.is_open()) {
      LOG(LogLevel::FATAL, LogComponent::IO_EVENTS,
          "Failed to open event source file: " << path);
      throw std::runtime_error("Failed to open event source file: " + path);
    }
    input_ = &file_stream_;
  } else {
    source_name_ = "stdin";
  }
  LOG(LogLevel::INFO, LogComponent::IO_EVENTS,
      "Reading events from " << source_name_);
}

JsonLinesEventReader::JsonLinesEventReader(std::istream &input, bool follow,
                                           size_t batch_size)
    : input_(&input), source_name_("stream"), follow_(follow),
      batch_size_(batch_size == 0 ? DEFAULT_BATCH_SIZE : batch_size) {}

JsonLinesEventReader::~JsonLinesEventReader() {
  LOG(LogLevel::INFO, LogComponent::IO_EVENTS,
      "Event reader for " << source_name_ << " closed. Lines read: "
                          << line_number_ << ", malformed: "
                          << malformed_lines_);
}

bool JsonLinesEventReader::is_exhausted() const { return exhausted_; }

std::vector<EventPtr> JsonLinesEventReader::get_next_batch() {
  std::vector<EventPtr> batch;
  if (exhausted_)
    return batch;

  batch.reserve(batch_size_);
  std::string line;
  while (batch.size() < batch_size_ && std::getline(*input_, line)) {
    ++line_number_;
    Utils::trim_inplace(line);
    if (line.empty())
      continue;

    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      ++malformed_lines_;
      LOG(LogLevel::WARN, LogComponent::IO_EVENTS,
          "Skipping malformed JSON at " << source_name_ << ":"
                                        << line_number_);
      continue;
    }

    std::string error;
    auto event = Event::from_json(j, &error);
    if (!event) {
      ++malformed_lines_;
      LOG(LogLevel::WARN, LogComponent::IO_EVENTS,
          "Skipping invalid event at " << source_name_ << ":" << line_number_
                                       << ": " << error);
      continue;
    }
    batch.push_back(std::make_shared<const Event>(std::move(*event)));
  }

  if (input_->eof()) {
    // Clearing the error state lets a followed file be tailed
    if (follow_)
      input_->clear();
    else
      exhausted_ = true;
  } else if (input_->bad()) {
    LOG(LogLevel::ERROR, LogComponent::IO_EVENTS,
        "Read error on " << source_name_ << "; no further events.");
    exhausted_ = true;
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_EVENTS,
      "Read " << batch.size() << " events from " << source_name_
              << " (line " << line_number_ << ")");
  return batch;
}
