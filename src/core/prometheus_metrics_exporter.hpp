#ifndef PROMETHEUS_METRICS_EXPORTER_HPP
#define PROMETHEUS_METRICS_EXPORTER_HPP

#include "core/config.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <httplib.h>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace prometheus {

using Labels = std::map<std::string, std::string>;

/**
 * Registry of counters, gauges and histograms rendered in the Prometheus
 * text exposition format (0.0.4), served together with a health check and
 * a JSON statistics page over HTTP.
 *
 * Registration and updates throw std::invalid_argument on unknown metrics,
 * invalid names or label sets that do not match the registration.
 */
class PrometheusMetricsExporter {
public:
  struct Config {
    std::string host;
    int port;
    std::string metrics_path;
    std::string health_path;
    std::string stats_path;

    Config()
        : host("0.0.0.0"), port(9464), metrics_path("/metrics"),
          health_path("/health"), stats_path("/stats") {}

    static Config from_app_config(const ::Config::PrometheusConfig &config);
  };

  // true = healthy; the health endpoint answers 503 otherwise
  using HealthProvider = std::function<bool()>;
  // Body of the stats endpoint, already serialized as JSON
  using StatsProvider = std::function<std::string()>;

  explicit PrometheusMetricsExporter(const Config &config = Config{});
  virtual ~PrometheusMetricsExporter();

  PrometheusMetricsExporter(const PrometheusMetricsExporter &) = delete;
  PrometheusMetricsExporter &
  operator=(const PrometheusMetricsExporter &) = delete;

  virtual void register_counter(const std::string &name,
                                const std::string &help,
                                const std::vector<std::string> &label_names = {});
  virtual void register_gauge(const std::string &name, const std::string &help,
                              const std::vector<std::string> &label_names = {});
  virtual void
  register_histogram(const std::string &name, const std::string &help,
                     const std::vector<double> &buckets = {},
                     const std::vector<std::string> &label_names = {});

  virtual void increment_counter(const std::string &name,
                                 const Labels &labels = {},
                                 double value = 1.0);
  virtual void set_gauge(const std::string &name, double value,
                         const Labels &labels = {});
  virtual void observe_histogram(const std::string &name, double value,
                                 const Labels &labels = {});

  bool has_metric(const std::string &name) const;
  // Current value of a counter or gauge series; 0 when never touched
  double get_value(const std::string &name, const Labels &labels = {}) const;

  void set_health_provider(HealthProvider provider);
  void set_stats_provider(StatsProvider provider);

  bool start_server();
  void stop_server();
  bool is_running() const;

  std::string generate_metrics_output() const;

private:
  enum class Kind { COUNTER, GAUGE };

  struct ScalarFamily {
    Kind kind;
    std::string help;
    std::vector<std::string> label_names;
    std::map<Labels, std::atomic<double>> values;
    mutable std::shared_mutex mutex;
  };

  struct HistogramSeries {
    std::vector<std::atomic<uint64_t>> bucket_counts;
    std::atomic<double> sum{0.0};
    std::atomic<uint64_t> count{0};

    explicit HistogramSeries(size_t buckets) : bucket_counts(buckets) {}
  };

  struct HistogramFamily {
    std::string help;
    std::vector<std::string> label_names;
    std::vector<double> bounds; // sorted, last is +Inf
    std::map<Labels, std::unique_ptr<HistogramSeries>> series;
    mutable std::shared_mutex mutex;
  };

  void register_scalar(Kind kind, const std::string &name,
                       const std::string &help,
                       const std::vector<std::string> &label_names);
  ScalarFamily &find_scalar(Kind kind, const std::string &name) const;

  static void add_to(std::atomic<double> &target, double delta);
  static void check_labels(const std::string &name,
                           const std::vector<std::string> &label_names,
                           const Labels &labels);
  static void validate_metric_name(const std::string &name);
  static void validate_label_names(const std::vector<std::string> &label_names);
  static std::string escape_label_value(const std::string &value);
  static std::string format_labels(const Labels &labels);
  static std::string format_bound(double bound);

  void setup_http_handlers();

  Config config_;

  std::unordered_map<std::string, std::unique_ptr<ScalarFamily>> scalars_;
  std::unordered_map<std::string, std::unique_ptr<HistogramFamily>>
      histograms_;
  std::vector<std::string> registration_order_;
  mutable std::shared_mutex metrics_mutex_;

  mutable std::shared_mutex providers_mutex_;
  HealthProvider health_provider_;
  StatsProvider stats_provider_;

  std::unique_ptr<httplib::Server> server_;
  std::unique_ptr<std::thread> server_thread_;
  std::atomic<bool> server_running_{false};
};

} // namespace prometheus

#endif // PROMETHEUS_METRICS_EXPORTER_HPP
