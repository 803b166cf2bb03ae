#include "core/config.hpp"
#include "core/correlation_pipeline.hpp"
#include "core/logger.hpp"
#include "core/prometheus_metrics_exporter.hpp"
#include "detection/condition_evaluator.hpp"
#include "io/actions/file_action_executor.hpp"
#include "io/actions/webhook_action_executor.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/event_readers/json_lines_event_reader.hpp"
#include "io/incident/in_memory_incident_manager.hpp"
#include "io/rule_store/json_file_rule_store.hpp"
#include "io/rule_store/mongo_rule_store.hpp"
#include "utils/json_formatter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_requested = true;
}

namespace {

std::shared_ptr<IRuleStore> make_rule_store(const Config::AppConfig &config) {
  LOG(LogLevel::INFO, LogComponent::IO_RULES,
      "Initializing rule store of type: " << config.rule_source_type);

  if (config.rule_source_type == "file")
    return std::make_shared<JsonFileRuleStore>(config.rules_file_path);

  if (config.rule_source_type == "mongodb") {
    auto manager = std::make_shared<MongoManager>(config.mongo_rule_store.uri);
    if (!manager->ping())
      LOG(LogLevel::WARN, LogComponent::IO_RULES,
          "MongoDB not reachable yet; rules load on the next reload.");
    return std::make_shared<MongoRuleStore>(manager, config.mongo_rule_store);
  }

  throw std::invalid_argument("Unknown rule_source_type: " +
                              config.rule_source_type);
}

std::vector<std::shared_ptr<IActionExecutor>>
make_action_executors(const Config::ActionsConfig &config) {
  std::vector<std::shared_ptr<IActionExecutor>> executors;
  if (config.file_enabled)
    executors.push_back(std::make_shared<FileActionExecutor>(config.file_path));
  if (config.http_enabled)
    executors.push_back(
        std::make_shared<WebhookActionExecutor>(config.http_webhook_url));

  for (const auto &executor : executors)
    LOG(LogLevel::INFO, LogComponent::IO_ACTIONS,
        "Action executor enabled: " << executor->get_name());
  return executors;
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);
  std::cin.tie(nullptr);

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];

  if (!config_manager.load_configuration(config_file_to_load)) {
    if (std::filesystem::exists(config_file_to_load))
      return 1;
    std::cerr << "Using built-in defaults." << std::endl;
  }
  auto current_config = config_manager.get_config();

  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Correlation engine starting up (PID " << getpid() << ")");

  // --- Build Collaborators And Pipeline ---
  std::unique_ptr<correlation::CorrelationPipeline> pipeline;
  std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter;
  std::unique_ptr<JsonLinesEventReader> reader;
  try {
    correlation::PipelineCollaborators collaborators;
    collaborators.rule_store = make_rule_store(*current_config);
    collaborators.evaluator = std::make_shared<correlation::ConditionEvaluator>();
    collaborators.incident_manager =
        std::make_shared<InMemoryIncidentManager>();
    collaborators.action_executors =
        make_action_executors(current_config->actions);

    pipeline = std::make_unique<correlation::CorrelationPipeline>(
        *current_config, std::move(collaborators));

    if (current_config->prometheus.enabled) {
      exporter = std::make_shared<prometheus::PrometheusMetricsExporter>(
          prometheus::PrometheusMetricsExporter::Config::from_app_config(
              current_config->prometheus));
      pipeline->set_metrics_exporter(exporter);

      auto *engine = pipeline.get();
      exporter->set_health_provider(
          [engine]() { return !engine->is_circuit_open(); });
      exporter->set_stats_provider([engine]() {
        return JsonFormatter::engine_stats_to_json_object(
                   engine->get_engine_stats())
            .dump(2);
      });
      if (!exporter->start_server())
        LOG(LogLevel::WARN, LogComponent::METRICS,
            "Continuing without the metrics endpoint.");
    }

    reader = std::make_unique<JsonLinesEventReader>(
        current_config->event_input_path,
        current_config->live_monitoring_enabled);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to initialize the correlation engine: " << e.what());
    return 1;
  }

  pipeline->initialize();

  // --- Main Event Loop ---
  uint64_t submitted = 0, dropped = 0;
  while (!g_shutdown_requested) {
    if (g_reload_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE, "SIGHUP received, reloading.");
      if (config_manager.load_configuration(config_file_to_load))
        LogManager::instance().configure(config_manager.get_config()->logging);
      pipeline->reload_rules();
    }

    std::vector<EventPtr> batch = reader->get_next_batch();
    for (auto &event : batch) {
      if (correlation::is_dropped(pipeline->process_event(std::move(event))))
        ++dropped;
      ++submitted;
    }

    if (batch.empty()) {
      if (reader->is_exhausted())
        break;
      std::this_thread::sleep_for(
          std::chrono::seconds(current_config->live_monitoring_sleep_seconds));
    }
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Event input finished: " << submitted << " submitted, " << dropped
                               << " dropped at ingress.");

  pipeline->shutdown();
  if (exporter)
    exporter->stop_server();

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Final engine statistics: "
          << JsonFormatter::engine_stats_to_json_object(
                 pipeline->get_engine_stats())
                 .dump());
  return 0;
}
