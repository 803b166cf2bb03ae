#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Config {

namespace {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"pipeline.admission", LogComponent::ADMISSION},
    {"pipeline.routing", LogComponent::ROUTING},
    {"pipeline.index", LogComponent::INDEX},
    {"pipeline.cache", LogComponent::CACHE},
    {"pipeline.eval", LogComponent::EVAL},
    {"pipeline.batch", LogComponent::BATCH},
    {"pipeline.tuner", LogComponent::TUNER},
    {"pipeline.buffer", LogComponent::BUFFER},
    {"pipeline.dispatch", LogComponent::DISPATCH},
    {"io.rules", LogComponent::IO_RULES},
    {"io.events", LogComponent::IO_EVENTS},
    {"io.actions", LogComponent::IO_ACTIONS},
    {"metrics", LogComponent::METRICS}};

bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

template <typename T> void assign_number(const std::string &value, T &target) {
  target = Utils::string_to_number<T>(value).value_or(target);
}

} // namespace

LoggingConfig::LoggingConfig() {
  for (const auto &pair : key_to_component_map)
    log_levels[pair.second] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO;
}

bool validate_engine_config(const EngineConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_processing_time_ms < 1) {
    errors.push_back("Engine max_processing_time_ms must be at least 1");
    valid = false;
  }

  if (config.batch_size < 1 || config.batch_size > 100000) {
    errors.push_back("Engine batch_size must be between 1 and 100000");
    valid = false;
  }

  if (config.batch_flush_interval_ms < 1) {
    errors.push_back("Engine batch_flush_interval_ms must be at least 1");
    valid = false;
  }

  if (config.batch_chunk_size < 1) {
    errors.push_back("Engine batch_chunk_size must be at least 1");
    valid = false;
  }

  if (config.max_concurrent_events < 1) {
    errors.push_back("Engine max_concurrent_events must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_circuit_breaker_config(const CircuitBreakerConfig &config,
                                     std::vector<std::string> &errors) {
  bool valid = true;

  if (config.failure_threshold < 1) {
    errors.push_back("Circuit breaker failure_threshold must be at least 1");
    valid = false;
  }

  if (config.timeout_ms < 1) {
    errors.push_back("Circuit breaker timeout_ms must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_worker_pool_config(const WorkerPoolConfig &config,
                                 std::vector<std::string> &errors) {
  bool valid = true;

  if (config.fast_pool_concurrency < 1 || config.normal_pool_concurrency < 1) {
    errors.push_back("Worker pool concurrency must be at least 1");
    valid = false;
  }

  if (config.fast_pool_timeout_ms < 1 || config.normal_pool_timeout_ms < 1) {
    errors.push_back("Worker pool timeouts must be at least 1 ms");
    valid = false;
  }

  return valid;
}

bool validate_cache_config(const CacheConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.shard_count < 1 || config.shard_count > 1024) {
    errors.push_back("Cache shard_count must be between 1 and 1024");
    valid = false;
  }

  if (config.cleanup_interval_seconds < 1) {
    errors.push_back("Cache cleanup_interval_seconds must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_tuning_config(const TuningConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.interval_seconds < 1) {
    errors.push_back("Tuning interval_seconds must be at least 1");
    valid = false;
  }

  if (config.stream_mode_latency_ratio <= 0.0 ||
      config.stream_mode_latency_ratio > 1.0) {
    errors.push_back(
        "Tuning stream_mode_latency_ratio must be in the range (0, 1]");
    valid = false;
  }

  if (config.min_batch_size < 1) {
    errors.push_back("Tuning min_batch_size must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_event_buffer_config(const EventBufferConfig &config,
                                  std::vector<std::string> &errors) {
  bool valid = true;

  if (config.inline_cap > config.trim_threshold) {
    errors.push_back(
        "Event buffer inline_cap must not exceed trim_threshold");
    valid = false;
  }

  if (config.sweep_interval_seconds < 1) {
    errors.push_back("Event buffer sweep_interval_seconds must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_dispatch_config(const DispatchConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_threads < 1 || config.worker_threads > 256) {
    errors.push_back("Dispatch worker_threads must be between 1 and 256");
    valid = false;
  }

  if (config.max_pending < 1) {
    errors.push_back("Dispatch max_pending must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Prometheus port must be between 1 and 65535");
    valid = false;
  }

  for (const auto *path :
       {&config.metrics_path, &config.health_path, &config.stats_path}) {
    if (path->empty() || (*path)[0] != '/') {
      errors.push_back("Prometheus endpoint paths must start with '/'");
      valid = false;
      break;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.rule_source_type != "file" &&
      config.rule_source_type != "mongodb") {
    errors.push_back("rule_source_type must be 'file' or 'mongodb'");
    valid = false;
  }

  if (config.actions.http_enabled && config.actions.http_webhook_url.empty()) {
    errors.push_back("Actions http_enabled requires http_webhook_url");
    valid = false;
  }

  valid &= validate_engine_config(config.engine, errors);
  valid &= validate_circuit_breaker_config(config.circuit_breaker, errors);
  valid &= validate_worker_pool_config(config.worker_pools, errors);
  valid &= validate_cache_config(config.cache, errors);
  valid &= validate_tuning_config(config.tuning, errors);
  valid &= validate_event_buffer_config(config.event_buffer, errors);
  valid &= validate_dispatch_config(config.dispatch, errors);
  if (config.prometheus.enabled)
    valid &= validate_prometheus_config(config.prometheus, errors);

  return valid;
}

static void apply_setting(AppConfig &config, const std::string &section,
                          const std::string &key, const std::string &value) {
  if (section.empty()) {
    if (key == Keys::RULE_SOURCE_TYPE)
      config.rule_source_type = Utils::to_lower(value);
    else if (key == Keys::RULES_FILE_PATH)
      config.rules_file_path = value;
    else if (key == Keys::EVENT_INPUT_PATH)
      config.event_input_path = value;
    else if (key == Keys::LIVE_MONITORING_ENABLED)
      config.live_monitoring_enabled = string_to_bool(value);
    else if (key == Keys::LIVE_MONITORING_SLEEP_SECONDS)
      assign_number(value, config.live_monitoring_sleep_seconds);
    else
      config.custom_settings[key] = value;

  } else if (section == "Engine") {
    auto &en = config.engine;
    if (key == Keys::EN_MAX_PROCESSING_TIME_MS)
      assign_number(value, en.max_processing_time_ms);
    else if (key == Keys::EN_BATCH_PROCESSING_ENABLED)
      en.batch_processing_enabled = string_to_bool(value);
    else if (key == Keys::EN_BATCH_SIZE)
      assign_number(value, en.batch_size);
    else if (key == Keys::EN_BATCH_FLUSH_INTERVAL_MS)
      assign_number(value, en.batch_flush_interval_ms);
    else if (key == Keys::EN_BATCH_CHUNK_SIZE)
      assign_number(value, en.batch_chunk_size);
    else if (key == Keys::EN_FAST_PATH_CACHE_TTL_MS)
      assign_number(value, en.fast_path_cache_ttl_ms);
    else if (key == Keys::EN_PARALLEL_RULE_EVALUATION)
      en.parallel_rule_evaluation = string_to_bool(value);
    else if (key == Keys::EN_FAST_PATH_ENABLED)
      en.fast_path_enabled = string_to_bool(value);
    else if (key == Keys::EN_STREAM_PROCESSING_MODE)
      en.stream_processing_mode = string_to_bool(value);
    else if (key == Keys::EN_CIRCUIT_BREAKER_ENABLED)
      en.circuit_breaker_enabled = string_to_bool(value);
    else if (key == Keys::EN_MAX_CONCURRENT_EVENTS)
      assign_number(value, en.max_concurrent_events);
    else if (key == Keys::EN_PRIORITY_QUEUE_ENABLED)
      en.priority_queue_enabled = string_to_bool(value);

  } else if (section == "CircuitBreaker") {
    if (key == Keys::CB_FAILURE_THRESHOLD)
      assign_number(value, config.circuit_breaker.failure_threshold);
    else if (key == Keys::CB_TIMEOUT_MS)
      assign_number(value, config.circuit_breaker.timeout_ms);

  } else if (section == "WorkerPools") {
    auto &wp = config.worker_pools;
    if (key == Keys::WP_FAST_CONCURRENCY)
      assign_number(value, wp.fast_pool_concurrency);
    else if (key == Keys::WP_FAST_TIMEOUT_MS)
      assign_number(value, wp.fast_pool_timeout_ms);
    else if (key == Keys::WP_NORMAL_CONCURRENCY)
      assign_number(value, wp.normal_pool_concurrency);
    else if (key == Keys::WP_NORMAL_TIMEOUT_MS)
      assign_number(value, wp.normal_pool_timeout_ms);

  } else if (section == "Cache") {
    if (key == Keys::CA_RULE_EVALUATION_TTL_MS)
      assign_number(value, config.cache.rule_evaluation_ttl_ms);
    else if (key == Keys::CA_CLEANUP_INTERVAL_SECONDS)
      assign_number(value, config.cache.cleanup_interval_seconds);
    else if (key == Keys::CA_SHARD_COUNT)
      assign_number(value, config.cache.shard_count);

  } else if (section == "Tuning") {
    auto &tu = config.tuning;
    if (key == Keys::TU_ENABLED)
      tu.enabled = string_to_bool(value);
    else if (key == Keys::TU_INTERVAL_SECONDS)
      assign_number(value, tu.interval_seconds);
    else if (key == Keys::TU_STREAM_MODE_LATENCY_RATIO)
      assign_number(value, tu.stream_mode_latency_ratio);
    else if (key == Keys::TU_QUEUE_DEPTH_BATCH_THRESHOLD)
      assign_number(value, tu.queue_depth_batch_threshold);
    else if (key == Keys::TU_MIN_BATCH_SIZE)
      assign_number(value, tu.min_batch_size);
    else if (key == Keys::TU_BATCH_SIZE_STEP)
      assign_number(value, tu.batch_size_step);

  } else if (section == "EventBuffer") {
    auto &eb = config.event_buffer;
    if (key == Keys::EB_RETENTION_MINUTES)
      assign_number(value, eb.retention_minutes);
    else if (key == Keys::EB_TRIM_THRESHOLD)
      assign_number(value, eb.trim_threshold);
    else if (key == Keys::EB_INLINE_CAP)
      assign_number(value, eb.inline_cap);
    else if (key == Keys::EB_SWEEP_CAP)
      assign_number(value, eb.sweep_cap);
    else if (key == Keys::EB_SWEEP_INTERVAL_SECONDS)
      assign_number(value, eb.sweep_interval_seconds);

  } else if (section == "Dispatch") {
    if (key == Keys::DI_WORKER_THREADS)
      assign_number(value, config.dispatch.worker_threads);
    else if (key == Keys::DI_MAX_PENDING)
      assign_number(value, config.dispatch.max_pending);

  } else if (section == "MongoRuleStore") {
    if (key == Keys::MO_URI)
      config.mongo_rule_store.uri = value;
    else if (key == Keys::MO_DATABASE)
      config.mongo_rule_store.database = value;
    else if (key == Keys::MO_RULES_COLLECTION)
      config.mongo_rule_store.rules_collection = value;

  } else if (section == "Actions") {
    if (key == Keys::AC_FILE_ENABLED)
      config.actions.file_enabled = string_to_bool(value);
    else if (key == Keys::AC_FILE_PATH)
      config.actions.file_path = value;
    else if (key == Keys::AC_HTTP_ENABLED)
      config.actions.http_enabled = string_to_bool(value);
    else if (key == Keys::AC_HTTP_WEBHOOK_URL)
      config.actions.http_webhook_url = value;

  } else if (section == "Logging") {
    if (key == Keys::LOGGING_DEFAULT_LEVEL) {
      LogLevel default_level = string_to_log_level(value);
      for (auto &pair : config.logging.log_levels)
        pair.second = default_level;
    } else {
      std::string lowered = Utils::to_lower(key);
      auto comp_it = key_to_component_map.find(lowered);
      if (comp_it != key_to_component_map.end())
        config.logging.log_levels[comp_it->second] = string_to_log_level(value);
      else if (lowered.length() > 2 &&
               lowered.compare(lowered.length() - 2, 2, ".*") == 0) {
        // "pipeline.* = DEBUG" covers every pipeline.<stage> key
        std::string prefix = lowered.substr(0, lowered.length() - 1);
        for (const auto &pair : key_to_component_map) {
          if (pair.first.rfind(prefix, 0) == 0)
            config.logging.log_levels[pair.second] =
                string_to_log_level(value);
        }
      }
    }

  } else if (section == "Prometheus") {
    auto &pr = config.prometheus;
    if (key == Keys::PROMETHEUS_ENABLED)
      pr.enabled = string_to_bool(value);
    else if (key == Keys::PROMETHEUS_HOST)
      pr.host = value;
    else if (key == Keys::PROMETHEUS_PORT)
      assign_number(value, pr.port);
    else if (key == Keys::PROMETHEUS_METRICS_PATH)
      pr.metrics_path = value;
    else if (key == Keys::PROMETHEUS_HEALTH_PATH)
      pr.health_path = value;
    else if (key == Keys::PROMETHEUS_STATS_PATH)
      pr.stats_path = value;
    else if (key == Keys::PROMETHEUS_PUBLISH_INTERVAL_SECONDS)
      assign_number(value, pr.publish_interval_seconds);
  }
}

static bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::ifstream config_file(filepath);
  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;
  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));
    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    apply_setting(config, current_section, key, value);
  }
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors)
      std::cerr << "  - " << error << std::endl;
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
