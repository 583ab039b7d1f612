#include <getopt.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "config/executor_config.hpp"
#include "execution/executor_manager.hpp"
#include "execution/panic_handler.hpp"
#include "logger/logger.hpp"

namespace {

// Handlers only set flags; the main loop does the work.
volatile sig_atomic_t g_shutdown_requested = 0;
volatile sig_atomic_t g_reload_requested = 0;
volatile sig_atomic_t g_stats_requested = 0;

void HandleShutdownSignal(int) { g_shutdown_requested = 1; }
void HandleReloadSignal(int) { g_reload_requested = 1; }
void HandleStatsSignal(int) { g_stats_requested = 1; }

}  // namespace

void print_help(const std::string &app_name) {
  std::cout << std::endl
            << "Usage: " << app_name << " [OPTIONS]" << std::endl
            << std::endl;
  std::cout << "  Options:" << std::endl;
  std::cout << "   -h --help                 Print this help." << std::endl;
  std::cout << "   -c --conf_file filename   Read executor configuration from the file." << std::endl;
  std::cout << std::endl;
  std::cout << "  Signals:" << std::endl;
  std::cout << "   SIGHUP                    Reload the configuration file." << std::endl;
  std::cout << "   SIGUSR1                   Log pool statistics." << std::endl;
  std::cout << "   SIGINT, SIGTERM           Drain all pools and exit." << std::endl;
  std::cout << std::endl;
}

void print_startup_config(const taskexec::config::ExecutorConfig &config,
                          const std::string &config_filename) {
  std::cout << "\n";
  std::cout << "================================================================================\n";
  std::cout << "                        TaskExec Startup Configuration                          \n";
  std::cout << "================================================================================\n";
  std::cout << " Executor:\n";
  std::cout << "   - Enabled                  : " << (config.enabled ? "YES" : "NO") << "\n";
  std::cout << "   - Shutdown Timeout         : " << config.shutdown_timeout.count() << " ms\n";
  std::cout << "   - Config File              : "
            << (config_filename.empty() ? std::string("(built-in defaults)") : config_filename) << "\n";
  std::cout << " Pools:\n";
  for (const auto &pool : config.pools) {
    std::cout << "   - " << pool.name << " size=" << pool.size
              << " expiry=" << pool.expiry_seconds << "s"
              << (pool.non_blocking ? " non-blocking" : " blocking") << "\n";
  }
  std::cout << "================================================================================\n\n";
}

taskexec::Status load_config(const std::string &config_filename,
                             taskexec::config::ExecutorConfig &config) {
  taskexec::config::ExecutorConfig loaded = taskexec::config::DefaultExecutorConfig();
  if (!config_filename.empty()) {
    taskexec::Status status = taskexec::config::LoadExecutorConfigFromFile(config_filename, loaded);
    if (!status.ok()) {
      return status;
    }
  }
  loaded.ApplyEnvOverrides();
  taskexec::Status status = loaded.Validate();
  if (!status.ok()) {
    return status;
  }
  config = loaded;
  return taskexec::Status::OK();
}

void log_pool_stats(taskexec::engine::execution::Manager &manager,
                    taskexec::engine::Logger &logger) {
  for (const auto &name : manager.ListPools()) {
    taskexec::engine::execution::PoolStats stats;
    taskexec::Status status = manager.GetPoolStats(name, stats);
    if (!status.ok()) {
      logger.Warning(status.ToString());
      continue;
    }
    logger.Info("pool=" + stats.name +
                " cap=" + std::to_string(stats.capacity) +
                " running=" + std::to_string(stats.running) +
                " free=" + std::to_string(stats.free) +
                " waiting=" + std::to_string(stats.waiting) +
                " submitted=" + std::to_string(stats.tasks_submitted) +
                " completed=" + std::to_string(stats.tasks_completed) +
                " panicked=" + std::to_string(stats.tasks_panicked) +
                " rejected=" + std::to_string(stats.tasks_rejected));
  }
}

int main(int argc, char *argv[]) {
  taskexec::engine::Logger logger;

  static struct option long_options[] = {{"conf_file", required_argument, nullptr, 'c'},
                                         {"help", no_argument, nullptr, 'h'},
                                         {nullptr, 0, nullptr, 0}};

  int option_index = 0;
  int value;
  std::string config_filename;
  std::string app_name = argv[0];

  while ((value = getopt_long(argc, argv, "c:h", long_options, &option_index)) != -1) {
    switch (value) {
      case 'c':
        config_filename = optarg;
        break;
      case 'h':
        print_help(app_name);
        return EXIT_SUCCESS;
      default:
        print_help(app_name);
        return EXIT_FAILURE;
    }
  }

  taskexec::config::ExecutorConfig config;
  taskexec::Status status = load_config(config_filename, config);
  if (!status.ok()) {
    logger.Error(status.ToString());
    logger.Error("TaskExec server exit...");
    return EXIT_FAILURE;
  }

  print_startup_config(config, config_filename);

  if (!config.enabled) {
    logger.Info("Executor disabled by configuration, nothing to run");
    return EXIT_SUCCESS;
  }

  taskexec::engine::execution::ManagerOptions options;
  options.panic_handler = std::make_shared<taskexec::engine::execution::LoggingPanicHandler>();
  options.shutdown_timeout = config.shutdown_timeout;

  std::shared_ptr<taskexec::engine::execution::Manager> manager;
  status = taskexec::engine::execution::NewManager(config.ToPoolConfigs(), manager, options);
  if (!status.ok()) {
    logger.Error(status.ToString());
    logger.Error("TaskExec server exit...");
    return EXIT_FAILURE;
  }
  logger.Info("TaskExec server started with " + std::to_string(config.pools.size()) + " pools");

  std::signal(SIGINT, HandleShutdownSignal);
  std::signal(SIGTERM, HandleShutdownSignal);
  std::signal(SIGHUP, HandleReloadSignal);
  std::signal(SIGUSR1, HandleStatsSignal);

  while (!g_shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    if (g_stats_requested) {
      g_stats_requested = 0;
      log_pool_stats(*manager, logger);
    }

    if (g_reload_requested) {
      g_reload_requested = 0;
      if (config_filename.empty()) {
        logger.Warning("Reload requested but no configuration file was given");
        continue;
      }

      taskexec::config::ExecutorConfig updated;
      status = load_config(config_filename, updated);
      if (!status.ok()) {
        logger.Error("Ignoring configuration change: " + status.ToString());
        continue;
      }
      if (updated.shutdown_timeout != config.shutdown_timeout) {
        logger.Warning("Changing the shutdown timeout requires a restart, keeping " +
                       std::to_string(config.shutdown_timeout.count()) + "ms");
      }
      if (!updated.enabled) {
        logger.Warning("Disabling the executor requires a restart, keeping current pools");
        continue;
      }
      if (!updated.PoolsChanged(config)) {
        logger.Info("Pool configuration unchanged, nothing to reload");
        continue;
      }

      status = manager->Reload(updated.ToPoolConfigs());
      if (status.ok()) {
        config.pools = updated.pools;
        logger.Info("Executor configuration reloaded");
      } else {
        logger.Error(status.ToString() + ", current pools keep serving");
      }
    }
  }

  logger.Info("Shutdown requested, draining pools");
  manager->Shutdown();
  logger.Info("TaskExec server stopped");
  return EXIT_SUCCESS;
}
