/**
 * @file main.cpp
 * @brief Entry point for the semcached daemon
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <thread>

#include "cache/cache_manager.h"
#include "cache/maintenance_scheduler.h"
#include "config/config.h"
#include "storage/file_document_store.h"
#include "utils/clock.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kShutdownPollIntervalMs = 100;  // Main loop poll interval

/**
 * @brief Signal handler for graceful shutdown
 *
 * This handler is async-signal-safe: it only sets an atomic flag.
 */
void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested = 1;
  }
}

/**
 * @brief Apply the logging section (level, file sink, structured format)
 */
bool SetupLogging(const semcache::config::LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      auto logger = spdlog::basic_logger_mt("semcached", logging.file);
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
      spdlog::error("Failed to open log file {}: {}", logging.file, e.what());
      return false;
    }
  }
  spdlog::set_level(spdlog::level::from_str(logging.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  semcache::utils::StructuredLog::SetFormat(logging.json ? semcache::utils::LogFormat::JSON
                                                          : semcache::utils::LogFormat::TEXT);
  return true;
}

void PrintConfigSummary(const semcache::config::Config& config) {
  std::cout << "Configuration file is valid\n";
  std::cout << "\nConfiguration summary:\n";
  std::cout << "  Cache:\n";
  std::cout << "    max_size: " << config.cache.max_size << "\n";
  std::cout << "    domains:";
  for (const auto& domain : config.cache.domains) {
    std::cout << " " << domain;
  }
  std::cout << "\n";
  std::cout << "    similarity_threshold: " << config.cache.similarity_threshold << "\n";
  std::cout << "    popularity: frequency=" << config.cache.popularity.frequency_weight
            << " recency=" << config.cache.popularity.recency_weight
            << " half_life_hours=" << config.cache.popularity.half_life_hours << "\n";
  std::cout << "  Storage:\n";
  std::cout << "    dir: " << (config.storage.dir.empty() ? "(disabled)" : config.storage.dir) << "\n";
  std::cout << "    mirror_timeout_ms: " << config.storage.mirror_timeout_ms << "\n";
  std::cout << "  Maintenance:\n";
  std::cout << "    enabled: " << (config.maintenance.enabled ? "true" : "false") << "\n";
  std::cout << "    optimize_interval_sec: " << config.maintenance.optimize_interval_sec << "\n";
  std::cout << "    expiry_interval_sec: " << config.maintenance.expiry_interval_sec << "\n";
  std::cout << "  Logging:\n";
  std::cout << "    level: " << config.logging.level << "\n";
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  const char* config_path = nullptr;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      std::cout << "Usage: " << argv[0] << " [OPTIONS] [<config.yaml>]\n";
      std::cout << "       " << argv[0] << " -c <config.yaml> [OPTIONS]\n";
      std::cout << "\n";
      std::cout << "Options:\n";
      std::cout << "  -c, --config <file>            Configuration file path\n";
      std::cout << "  -t, --config-test              Test configuration file and exit\n";
      std::cout << "  -h, --help                     Show this help message\n";
      std::cout << "  -v, --version                  Show version information\n";
      std::cout << "\n";
      std::cout << "Example:\n";
      std::cout << "  " << argv[0] << " -c /etc/semcache/config.yaml\n";
      std::cout << "  " << argv[0] << " examples/config.yaml\n";
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "semcached version " << semcache::Version::String() << "\n";
      std::cout << "Popularity-evicted semantic response cache\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      if (config_path == nullptr) {
        config_path = argv[i];
      } else {
        std::cerr << "Error: Multiple config files specified\n";
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  semcache::config::Config config;
  if (config_path != nullptr) {
    auto config_result = semcache::config::LoadConfig(config_path);
    if (!config_result) {
      spdlog::error("Failed to load config: {}", config_result.error().to_string());
      return 1;
    }
    config = *config_result;
    if (config_test_mode) {
      PrintConfigSummary(config);
      return 0;
    }
  } else if (config_test_mode) {
    std::cerr << "Error: --config-test requires a configuration file\n";
    return 1;
  }

  if (!SetupLogging(config.logging)) {
    return 1;
  }

  spdlog::info("semcached starting...");
  spdlog::info("Version: {}", semcache::Version::String());
  if (config_path == nullptr) {
    spdlog::info("No configuration file specified, using defaults");
  }

  semcache::utils::SystemClock clock;

  const auto storage_config = config.storage;
  semcache::cache::StoreFactory store_factory =
      [storage_config](const std::string& domain) -> std::shared_ptr<semcache::storage::DocumentStore> {
    if (storage_config.dir.empty()) {
      return nullptr;
    }
    auto store =
        semcache::storage::FileDocumentStore::Open(storage_config.dir, domain, storage_config.compact_min_records);
    if (!store) {
      spdlog::error("Failed to open store for '{}': {}", domain, store.error().to_string());
      return nullptr;
    }
    return std::shared_ptr<semcache::storage::DocumentStore>(std::move(*store));
  };

  semcache::cache::CacheManager manager(config, store_factory, clock);
  manager.RecoverAll();

  if (!config.warmup.seed_file.empty()) {
    auto seeds = semcache::cache::LoadWarmUpSeeds(config.warmup.seed_file);
    if (!seeds) {
      spdlog::warn("Skipping warm-up: {}", seeds.error().to_string());
    } else {
      manager.WarmUp(*seeds);
    }
  }

  semcache::cache::MaintenanceScheduler scheduler(manager, config.maintenance, config.cache.expiry_max_age_days,
                                                  clock);
  if (config.maintenance.enabled) {
    scheduler.Start();
  }

  auto health = manager.HealthCheck();
  spdlog::info("Startup health: {}", health.ToJson().dump());

  spdlog::info("semcached is running. Press Ctrl+C to stop.");
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kShutdownPollIntervalMs));
  }

  spdlog::info("Shutdown signal received");
  scheduler.Stop();
  if (!manager.FlushMirrors()) {
    spdlog::warn("Durable mirror did not drain before shutdown; pending writes are dropped");
  }
  spdlog::info("Final metrics: {}", manager.GetMetrics().ToJson().dump());
  spdlog::info("semcached stopped gracefully");

  return 0;
}
