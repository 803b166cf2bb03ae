#include "file_action_executor.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <stdexcept>
#include <string>

FileActionExecutor::FileActionExecutor(const std::string &file_path)
    : output_path_(file_path) {
  if (output_path_.empty())
    throw std::invalid_argument("FileActionExecutor requires a file path");

  Utils::create_directory_for_file(output_path_);
  output_stream_.open(output_path_, std::ios::app);
  if (!output_stream_.is_open())
    LOG(LogLevel::ERROR, LogComponent::IO_ACTIONS,
        "FileActionExecutor could not open output file: " << output_path_);
}

FileActionExecutor::~FileActionExecutor() { close(); }

void FileActionExecutor::close() {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (output_stream_.is_open()) {
    output_stream_.flush();
    output_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_ACTIONS,
        "FileActionExecutor closed output file: " << output_path_);
  }
}

bool FileActionExecutor::execute_actions(const Rule &rule,
                                         const Incident &incident,
                                         const Event &event) {
  std::string line =
      JsonFormatter::format_action_record(rule, incident, event);

  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!output_stream_.is_open())
    return false;

  output_stream_ << line << std::endl;
  if (!output_stream_.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_ACTIONS,
        "Failed to write incident " << incident.id << " to "
                                    << output_path_);
    return false;
  }

  LOG(LogLevel::TRACE, LogComponent::IO_ACTIONS,
      "Incident " << incident.id << " written to " << output_path_);
  return true;
}
