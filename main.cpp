#include "Config.hpp"
#include "Logger.hpp"
#include "Monitor.hpp"
#include "Notifications.hpp"
#include "Watcher.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

using namespace foldermon;

int main(int argc, char *argv[]) {
  Config config;
  try {
    config = loadConfig(FOLDERMON_CONFIG_FILE);
  } catch (const ConfigError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  std::unique_ptr<Logger> logger;
  try {
    logger = std::make_unique<Logger>(config.logFilePath);
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  logger->info("Starting folder monitor...");

  try {
    resolveFolders(config, argc, argv);
  } catch (const UsageError &e) {
    logger->fatal(e.what());
  }

  std::cout << "Watching folder: " << config.watchFolder << "\n";
  std::cout << "Backup folder: " << config.backupFolder << "\n";

  try {
    std::filesystem::create_directories(config.backupFolder);
    if (!config.stagingFolder.empty()) {
      std::filesystem::create_directories(config.stagingFolder);
    }
  } catch (const std::filesystem::filesystem_error &e) {
    logger->fatal(e.what());
  }

  NotificationQueue queue;
  std::unique_ptr<Watcher> watcher;
  try {
    watcher = std::make_unique<Watcher>(*logger, queue);
    watcher->watchDirectory(config.watchFolder);
  } catch (const std::system_error &e) {
    logger->fatal(e.what());
  }
  watcher->start();

  Monitor monitor(config, *logger);
  int status = monitor.run(queue);
  watcher->stop();
  return status;
}
