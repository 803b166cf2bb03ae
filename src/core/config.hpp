#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *RULE_SOURCE_TYPE = "rule_source_type";
constexpr const char *RULES_FILE_PATH = "rules_file_path";
constexpr const char *EVENT_INPUT_PATH = "event_input_path";
constexpr const char *LIVE_MONITORING_ENABLED = "live_monitoring_enabled";
constexpr const char *LIVE_MONITORING_SLEEP_SECONDS =
    "live_monitoring_sleep_seconds";

// Engine Settings
constexpr const char *EN_MAX_PROCESSING_TIME_MS = "max_processing_time_ms";
constexpr const char *EN_BATCH_PROCESSING_ENABLED = "batch_processing_enabled";
constexpr const char *EN_BATCH_SIZE = "batch_size";
constexpr const char *EN_BATCH_FLUSH_INTERVAL_MS = "batch_flush_interval_ms";
constexpr const char *EN_BATCH_CHUNK_SIZE = "batch_chunk_size";
constexpr const char *EN_FAST_PATH_CACHE_TTL_MS = "fast_path_cache_ttl_ms";
constexpr const char *EN_PARALLEL_RULE_EVALUATION = "parallel_rule_evaluation";
constexpr const char *EN_FAST_PATH_ENABLED = "fast_path_enabled";
constexpr const char *EN_STREAM_PROCESSING_MODE = "stream_processing_mode";
constexpr const char *EN_CIRCUIT_BREAKER_ENABLED = "circuit_breaker_enabled";
constexpr const char *EN_MAX_CONCURRENT_EVENTS = "max_concurrent_events";
constexpr const char *EN_PRIORITY_QUEUE_ENABLED = "priority_queue_enabled";

// Circuit Breaker Settings
constexpr const char *CB_FAILURE_THRESHOLD = "failure_threshold";
constexpr const char *CB_TIMEOUT_MS = "timeout_ms";

// Worker Pool Settings
constexpr const char *WP_FAST_CONCURRENCY = "fast_pool_concurrency";
constexpr const char *WP_FAST_TIMEOUT_MS = "fast_pool_timeout_ms";
constexpr const char *WP_NORMAL_CONCURRENCY = "normal_pool_concurrency";
constexpr const char *WP_NORMAL_TIMEOUT_MS = "normal_pool_timeout_ms";

// Cache Settings
constexpr const char *CA_RULE_EVALUATION_TTL_MS = "rule_evaluation_ttl_ms";
constexpr const char *CA_CLEANUP_INTERVAL_SECONDS = "cleanup_interval_seconds";
constexpr const char *CA_SHARD_COUNT = "shard_count";

// Tuning Settings
constexpr const char *TU_ENABLED = "enabled";
constexpr const char *TU_INTERVAL_SECONDS = "interval_seconds";
constexpr const char *TU_STREAM_MODE_LATENCY_RATIO =
    "stream_mode_latency_ratio";
constexpr const char *TU_QUEUE_DEPTH_BATCH_THRESHOLD =
    "queue_depth_batch_threshold";
constexpr const char *TU_MIN_BATCH_SIZE = "min_batch_size";
constexpr const char *TU_BATCH_SIZE_STEP = "batch_size_step";

// Event Buffer Settings
constexpr const char *EB_RETENTION_MINUTES = "retention_minutes";
constexpr const char *EB_TRIM_THRESHOLD = "trim_threshold";
constexpr const char *EB_INLINE_CAP = "inline_cap";
constexpr const char *EB_SWEEP_CAP = "sweep_cap";
constexpr const char *EB_SWEEP_INTERVAL_SECONDS = "sweep_interval_seconds";

// Dispatch Settings
constexpr const char *DI_WORKER_THREADS = "worker_threads";
constexpr const char *DI_MAX_PENDING = "max_pending";

// Mongo Settings
constexpr const char *MO_URI = "uri";
constexpr const char *MO_DATABASE = "database";
constexpr const char *MO_RULES_COLLECTION = "rules_collection";

// Action Settings
constexpr const char *AC_FILE_ENABLED = "file_enabled";
constexpr const char *AC_FILE_PATH = "file_path";
constexpr const char *AC_HTTP_ENABLED = "http_enabled";
constexpr const char *AC_HTTP_WEBHOOK_URL = "http_webhook_url";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Prometheus Settings
constexpr const char *PROMETHEUS_ENABLED = "enabled";
constexpr const char *PROMETHEUS_HOST = "host";
constexpr const char *PROMETHEUS_PORT = "port";
constexpr const char *PROMETHEUS_METRICS_PATH = "metrics_path";
constexpr const char *PROMETHEUS_HEALTH_PATH = "health_path";
constexpr const char *PROMETHEUS_STATS_PATH = "stats_path";
constexpr const char *PROMETHEUS_PUBLISH_INTERVAL_SECONDS =
    "publish_interval_seconds";
} // namespace Keys

struct LoggingConfig {
  LoggingConfig(); // every component starts at INFO
  std::map<LogComponent, LogLevel> log_levels;
};

// Initial values of the runtime tunables; see RuntimeConfig
struct EngineConfig {
  uint32_t max_processing_time_ms = 200;
  bool batch_processing_enabled = false;
  size_t batch_size = 50;
  uint32_t batch_flush_interval_ms = 50;
  size_t batch_chunk_size = 10;
  uint64_t fast_path_cache_ttl_ms = 30000;
  bool parallel_rule_evaluation = true;
  bool fast_path_enabled = true;
  bool stream_processing_mode = false;
  bool circuit_breaker_enabled = true;
  size_t max_concurrent_events = 1000;
  bool priority_queue_enabled = true;
};

struct CircuitBreakerConfig {
  uint32_t failure_threshold = 5;
  uint64_t timeout_ms = 30000;
};

struct WorkerPoolConfig {
  size_t fast_pool_concurrency = 20;
  uint64_t fast_pool_timeout_ms = 2000;
  size_t normal_pool_concurrency = 50;
  uint64_t normal_pool_timeout_ms = 5000;
};

struct CacheConfig {
  uint64_t rule_evaluation_ttl_ms = 10000;
  uint32_t cleanup_interval_seconds = 60;
  size_t shard_count = 16;
};

struct TuningConfig {
  bool enabled = true;
  uint32_t interval_seconds = 15;
  double stream_mode_latency_ratio = 0.5;
  size_t queue_depth_batch_threshold = 100;
  size_t min_batch_size = 20;
  size_t batch_size_step = 10;
};

struct EventBufferConfig {
  uint32_t retention_minutes = 30;
  size_t trim_threshold = 100;
  size_t inline_cap = 50;
  size_t sweep_cap = 100;
  uint32_t sweep_interval_seconds = 120;
};

struct DispatchConfig {
  size_t worker_threads = 4;
  size_t max_pending = 10000;
};

struct MongoRuleStoreConfig {
  std::string uri = "mongodb://localhost:27017";
  std::string database = "siem";
  std::string rules_collection = "correlation_rules";
};

struct ActionsConfig {
  bool file_enabled = true;
  std::string file_path = "data/incidents.jsonl";
  bool http_enabled = false;
  std::string http_webhook_url;
};

struct PrometheusConfig {
  bool enabled = true;
  std::string host = "0.0.0.0";
  int port = 9464;
  std::string metrics_path = "/metrics";
  std::string health_path = "/health";
  std::string stats_path = "/stats";
  uint32_t publish_interval_seconds = 15;
};

struct AppConfig {
  std::string rule_source_type = "file";
  std::string rules_file_path = "data/rules.json";
  std::string event_input_path = "-";
  bool live_monitoring_enabled = false;
  uint64_t live_monitoring_sleep_seconds = 1;

  EngineConfig engine;
  CircuitBreakerConfig circuit_breaker;
  WorkerPoolConfig worker_pools;
  CacheConfig cache;
  TuningConfig tuning;
  EventBufferConfig event_buffer;
  DispatchConfig dispatch;
  MongoRuleStoreConfig mongo_rule_store;
  ActionsConfig actions;
  LoggingConfig logging;
  PrometheusConfig prometheus;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_engine_config(const EngineConfig &config,
                            std::vector<std::string> &errors);
bool validate_circuit_breaker_config(const CircuitBreakerConfig &config,
                                     std::vector<std::string> &errors);
bool validate_worker_pool_config(const WorkerPoolConfig &config,
                                 std::vector<std::string> &errors);
bool validate_cache_config(const CacheConfig &config,
                           std::vector<std::string> &errors);
bool validate_tuning_config(const TuningConfig &config,
                            std::vector<std::string> &errors);
bool validate_event_buffer_config(const EventBufferConfig &config,
                                  std::vector<std::string> &errors);
bool validate_dispatch_config(const DispatchConfig &config,
                              std::vector<std::string> &errors);
bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

LogLevel string_to_log_level(const std::string &level_str_raw);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
