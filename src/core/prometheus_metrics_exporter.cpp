#include "prometheus_metrics_exporter.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace prometheus {

PrometheusMetricsExporter::Config
PrometheusMetricsExporter::Config::from_app_config(
    const ::Config::PrometheusConfig &config) {
  Config result;
  result.host = config.host;
  result.port = config.port;
  result.metrics_path = config.metrics_path;
  result.health_path = config.health_path;
  result.stats_path = config.stats_path;
  return result;
}

PrometheusMetricsExporter::PrometheusMetricsExporter(const Config &config)
    : config_(config), server_(std::make_unique<httplib::Server>()) {
  setup_http_handlers();
}

PrometheusMetricsExporter::~PrometheusMetricsExporter() { stop_server(); }

void PrometheusMetricsExporter::register_scalar(
    Kind kind, const std::string &name, const std::string &help,
    const std::vector<std::string> &label_names) {
  validate_metric_name(name);
  validate_label_names(label_names);

  std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
  if (scalars_.count(name) || histograms_.count(name))
    throw std::invalid_argument("Metric '" + name + "' already exists");

  auto family = std::make_unique<ScalarFamily>();
  family->kind = kind;
  family->help = help;
  family->label_names = label_names;
  scalars_[name] = std::move(family);
  registration_order_.push_back(name);
}

void PrometheusMetricsExporter::register_counter(
    const std::string &name, const std::string &help,
    const std::vector<std::string> &label_names) {
  register_scalar(Kind::COUNTER, name, help, label_names);
}

void PrometheusMetricsExporter::register_gauge(
    const std::string &name, const std::string &help,
    const std::vector<std::string> &label_names) {
  register_scalar(Kind::GAUGE, name, help, label_names);
}

void PrometheusMetricsExporter::register_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &buckets,
    const std::vector<std::string> &label_names) {
  validate_metric_name(name);
  validate_label_names(label_names);
  if (std::find(label_names.begin(), label_names.end(), "le") !=
      label_names.end())
    throw std::invalid_argument("Histogram '" + name +
                                "' cannot use the 'le' label");

  auto family = std::make_unique<HistogramFamily>();
  family->help = help;
  family->label_names = label_names;
  family->bounds = buckets.empty()
                       ? std::vector<double>{0.001, 0.005, 0.01, 0.025, 0.05,
                                             0.1, 0.2, 0.5, 1.0, 2.5}
                       : buckets;
  std::sort(family->bounds.begin(), family->bounds.end());
  if (family->bounds.back() != std::numeric_limits<double>::infinity())
    family->bounds.push_back(std::numeric_limits<double>::infinity());

  std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
  if (scalars_.count(name) || histograms_.count(name))
    throw std::invalid_argument("Metric '" + name + "' already exists");
  histograms_[name] = std::move(family);
  registration_order_.push_back(name);
}

PrometheusMetricsExporter::ScalarFamily &
PrometheusMetricsExporter::find_scalar(Kind kind,
                                       const std::string &name) const {
  auto it = scalars_.find(name);
  if (it == scalars_.end() || it->second->kind != kind)
    throw std::invalid_argument(
        std::string(kind == Kind::COUNTER ? "Counter '" : "Gauge '") + name +
        "' not found");
  return *it->second;
}

void PrometheusMetricsExporter::add_to(std::atomic<double> &target,
                                       double delta) {
  double expected = target.load();
  while (!target.compare_exchange_weak(expected, expected + delta)) {
  }
}

void PrometheusMetricsExporter::increment_counter(const std::string &name,
                                                  const Labels &labels,
                                                  double value) {
  if (value < 0)
    throw std::invalid_argument("Counter '" + name +
                                "' cannot be decremented");

  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  ScalarFamily &family = find_scalar(Kind::COUNTER, name);
  check_labels(name, family.label_names, labels);

  std::unique_lock<std::shared_mutex> family_lock(family.mutex);
  add_to(family.values[labels], value);
}

void PrometheusMetricsExporter::set_gauge(const std::string &name,
                                          double value, const Labels &labels) {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  ScalarFamily &family = find_scalar(Kind::GAUGE, name);
  check_labels(name, family.label_names, labels);

  std::unique_lock<std::shared_mutex> family_lock(family.mutex);
  family.values[labels].store(value);
}

void PrometheusMetricsExporter::observe_histogram(const std::string &name,
                                                  double value,
                                                  const Labels &labels) {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  auto it = histograms_.find(name);
  if (it == histograms_.end())
    throw std::invalid_argument("Histogram '" + name + "' not found");

  HistogramFamily &family = *it->second;
  check_labels(name, family.label_names, labels);

  std::unique_lock<std::shared_mutex> family_lock(family.mutex);
  auto &series = family.series[labels];
  if (!series)
    series = std::make_unique<HistogramSeries>(family.bounds.size());

  // Buckets are cumulative
  for (size_t i = 0; i < family.bounds.size(); ++i)
    if (value <= family.bounds[i])
      series->bucket_counts[i].fetch_add(1);
  add_to(series->sum, value);
  series->count.fetch_add(1);
}

bool PrometheusMetricsExporter::has_metric(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  return scalars_.count(name) > 0 || histograms_.count(name) > 0;
}

double PrometheusMetricsExporter::get_value(const std::string &name,
                                            const Labels &labels) const {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  auto it = scalars_.find(name);
  if (it == scalars_.end())
    throw std::invalid_argument("Metric '" + name + "' not found");

  std::shared_lock<std::shared_mutex> family_lock(it->second->mutex);
  auto value = it->second->values.find(labels);
  return value == it->second->values.end() ? 0.0 : value->second.load();
}

void PrometheusMetricsExporter::set_health_provider(HealthProvider provider) {
  std::unique_lock<std::shared_mutex> lock(providers_mutex_);
  health_provider_ = std::move(provider);
}

void PrometheusMetricsExporter::set_stats_provider(StatsProvider provider) {
  std::unique_lock<std::shared_mutex> lock(providers_mutex_);
  stats_provider_ = std::move(provider);
}

bool PrometheusMetricsExporter::start_server() {
  if (server_running_.load())
    return true;

  if (!server_->bind_to_port(config_.host, config_.port)) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Metrics server could not bind " << config_.host << ":"
                                         << config_.port);
    return false;
  }

  server_running_.store(true);
  server_thread_ = std::make_unique<std::thread>([this]() {
    server_->listen_after_bind();
    server_running_.store(false);
  });

  LOG(LogLevel::INFO, LogComponent::METRICS,
      "Metrics server listening on " << config_.host << ":" << config_.port
                                     << config_.metrics_path);
  return true;
}

void PrometheusMetricsExporter::stop_server() {
  if (!server_thread_)
    return;

  server_->stop();
  if (server_thread_->joinable())
    server_thread_->join();
  server_thread_.reset();
  server_running_.store(false);
}

bool PrometheusMetricsExporter::is_running() const {
  return server_running_.load();
}

std::string PrometheusMetricsExporter::generate_metrics_output() const {
  std::ostringstream output;
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);

  for (const auto &name : registration_order_) {
    auto scalar = scalars_.find(name);
    if (scalar != scalars_.end()) {
      const ScalarFamily &family = *scalar->second;
      std::shared_lock<std::shared_mutex> family_lock(family.mutex);
      output << "# HELP " << name << " " << family.help << "\n";
      output << "# TYPE " << name << " "
             << (family.kind == Kind::COUNTER ? "counter" : "gauge") << "\n";
      for (const auto &[labels, value] : family.values)
        output << name << format_labels(labels) << " " << std::fixed
               << std::setprecision(6) << value.load() << "\n";
      continue;
    }

    const HistogramFamily &family = *histograms_.at(name);
    std::shared_lock<std::shared_mutex> family_lock(family.mutex);
    output << "# HELP " << name << " " << family.help << "\n";
    output << "# TYPE " << name << " histogram\n";
    for (const auto &[labels, series] : family.series) {
      for (size_t i = 0; i < family.bounds.size(); ++i) {
        Labels bucket_labels = labels;
        bucket_labels["le"] = format_bound(family.bounds[i]);
        output << name << "_bucket" << format_labels(bucket_labels) << " "
               << series->bucket_counts[i].load() << "\n";
      }
      output << name << "_sum" << format_labels(labels) << " " << std::fixed
             << std::setprecision(6) << series->sum.load() << "\n";
      output << name << "_count" << format_labels(labels) << " "
             << series->count.load() << "\n";
    }
  }
  return output.str();
}

void PrometheusMetricsExporter::check_labels(
    const std::string &name, const std::vector<std::string> &label_names,
    const Labels &labels) {
  if (labels.size() != label_names.size())
    throw std::invalid_argument("Label count mismatch for '" + name + "'");
  for (const auto &label : label_names)
    if (!labels.count(label))
      throw std::invalid_argument("Missing label '" + label + "' for '" +
                                  name + "'");
}

void PrometheusMetricsExporter::validate_metric_name(const std::string &name) {
  static const std::regex name_regex("^[a-zA-Z_:][a-zA-Z0-9_:]*$");
  if (!std::regex_match(name, name_regex))
    throw std::invalid_argument("Invalid metric name: '" + name + "'");
}

void PrometheusMetricsExporter::validate_label_names(
    const std::vector<std::string> &label_names) {
  static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");
  for (const auto &label : label_names) {
    if (!std::regex_match(label, label_regex))
      throw std::invalid_argument("Invalid label name: '" + label + "'");
    if (label.compare(0, 2, "__") == 0)
      throw std::invalid_argument("Label names starting with '__' are "
                                  "reserved: " +
                                  label);
  }
}

std::string
PrometheusMetricsExporter::escape_label_value(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '"':
      escaped += "\\\"";
      break;
    case '\n':
      escaped += "\\n";
      break;
    default:
      escaped += c;
    }
  }
  return escaped;
}

std::string PrometheusMetricsExporter::format_labels(const Labels &labels) {
  if (labels.empty())
    return "";

  std::string formatted = "{";
  bool first = true;
  for (const auto &[key, value] : labels) {
    if (!first)
      formatted += ",";
    formatted += key + "=\"" + escape_label_value(value) + "\"";
    first = false;
  }
  return formatted + "}";
}

std::string PrometheusMetricsExporter::format_bound(double bound) {
  if (bound == std::numeric_limits<double>::infinity())
    return "+Inf";
  std::ostringstream out;
  out << bound;
  return out.str();
}

void PrometheusMetricsExporter::setup_http_handlers() {
  auto no_cache = [](httplib::Response &res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Cache-Control",
                   "no-store, no-cache, must-revalidate, max-age=0");
  };

  server_->Get(config_.metrics_path, [this, no_cache](const httplib::Request &,
                                                      httplib::Response &res) {
    try {
      res.set_content(generate_metrics_output(),
                      "text/plain; version=0.0.4; charset=utf-8");
      res.status = 200;
    } catch (const std::exception &e) {
      res.set_content("Error generating metrics: " + std::string(e.what()),
                      "text/plain");
      res.status = 500;
    }
    no_cache(res);
  });

  server_->Get(config_.health_path, [this, no_cache](const httplib::Request &,
                                                     httplib::Response &res) {
    std::shared_lock<std::shared_mutex> lock(providers_mutex_);
    bool healthy = !health_provider_ || health_provider_();
    res.set_content(healthy ? "OK" : "UNAVAILABLE", "text/plain");
    res.status = healthy ? 200 : 503;
    no_cache(res);
  });

  server_->Get(config_.stats_path, [this, no_cache](const httplib::Request &,
                                                    httplib::Response &res) {
    std::shared_lock<std::shared_mutex> lock(providers_mutex_);
    if (!stats_provider_) {
      res.set_content("{\"error\": \"no statistics available\"}",
                      "application/json");
      res.status = 503;
      return;
    }
    try {
      res.set_content(stats_provider_(), "application/json");
      res.status = 200;
    } catch (const std::exception &e) {
      res.set_content("{\"error\": \"statistics unavailable\"}",
                      "application/json");
      res.status = 500;
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Stats provider failed: " << e.what());
    }
    no_cache(res);
  });
}

} // namespace prometheus
