#include "Config.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace foldermon {

namespace {

template <typename T>
void readKey(const json &j, const char *key, T &target) {
  if (!j.contains(key)) {
    return;
  }
  try {
    target = j.at(key).get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(std::string("invalid value for '") + key +
                      "': " + e.what());
  }
}

SettleStrategy parseSettleStrategy(const std::string &name) {
  if (name == "fixed") {
    return SettleStrategy::FixedDelay;
  }
  if (name == "size_poll") {
    return SettleStrategy::SizePolling;
  }
  throw ConfigError("unknown settle_strategy: " + name);
}

} // namespace

Config loadConfig(const std::string &configPath) {
  Config config;
  std::error_code ec;
  bool present = fs::exists(configPath, ec);
  if (ec) {
    throw ConfigError("cannot check " + configPath + ": " + ec.message());
  }
  if (!present) {
    return config;
  }

  std::ifstream f(configPath);
  if (!f.is_open()) {
    throw ConfigError("cannot open " + configPath);
  }

  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw ConfigError("cannot parse " + configPath + ": " + e.what());
  }
  if (!j.is_object()) {
    throw ConfigError(configPath + " must contain a JSON object");
  }

  readKey(j, "log_file", config.logFilePath);
  readKey(j, "staging_folder", config.stagingFolder);
  readKey(j, "delete_after_archive", config.deleteAfterArchive);
  readKey(j, "exit_on_archive_failure", config.exitOnArchiveFailure);

  long long debounceMs = config.debounce.count();
  readKey(j, "debounce_ms", debounceMs);
  if (debounceMs < 0) {
    throw ConfigError("debounce_ms must not be negative");
  }
  config.debounce = std::chrono::milliseconds(debounceMs);

  std::string strategy;
  readKey(j, "settle_strategy", strategy);
  if (!strategy.empty()) {
    config.settle = parseSettleStrategy(strategy);
  }

  readKey(j, "settle_max_polls", config.settleMaxPolls);
  if (config.settleMaxPolls < 1) {
    throw ConfigError("settle_max_polls must be at least 1");
  }

  if (config.logFilePath.empty()) {
    throw ConfigError("log_file must not be empty");
  }
  return config;
}

void resolveFolders(Config &config, int argc, const char *const argv[]) {
  if (argc != 3) {
    const char *prog = argc > 0 ? argv[0] : "foldermon";
    throw UsageError(std::string("usage: ") + prog +
                     " <watchFolder> <backupFolder>");
  }
  config.watchFolder = argv[1];
  config.backupFolder = argv[2];
}

} // namespace foldermon
