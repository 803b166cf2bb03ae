#ifndef FILE_ACTION_EXECUTOR_HPP
#define FILE_ACTION_EXECUTOR_HPP

#include "base_action_executor.hpp"

#include <fstream>
#include <mutex>
#include <string>

// Appends one JSON line per (incident, event) to a local file
class FileActionExecutor : public IActionExecutor {
public:
  explicit FileActionExecutor(const std::string &file_path);
  ~FileActionExecutor() override;

  bool execute_actions(const Rule &rule, const Incident &incident,
                       const Event &event) override;
  const char *get_name() const override { return "FileActionExecutor"; }
  std::string get_executor_type() const override { return "file"; }
  void close() override;

private:
  std::string output_path_;
  std::mutex stream_mutex_;
  std::ofstream output_stream_;
};

#endif // FILE_ACTION_EXECUTOR_HPP
