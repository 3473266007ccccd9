#pragma once

#include <string>
#include <vector>

namespace archiver {

struct AppConfig {
  std::string dataDir = "archive_data";
  std::string dbPath;   // derived from dataDir when empty
  std::string mediaDir; // derived from dataDir when empty
  std::string host = "127.0.0.1";
  int port = 5757;
  std::string browser;
  std::string defaultInstance;
  int maxPosts = 500;
  int remoteAttempts = 3;
  int remoteTimeoutSeconds = 30;
  int pageDelayMs = 1000;

  std::string databasePath() const;
  std::string mediaPath() const;
};

struct CommandLine {
  AppConfig config;
  std::string command = "serve";
  std::vector<std::string> args;
  bool showHelp = false;
};

/**
 * Configuration sources, lowest to highest precedence: built-in defaults,
 * a JSON file named by --config, ARCHIVER_* environment variables, and
 * command-line flags. Bad values raise InputError(InvalidArgument).
 */
class ConfigLoader {
public:
  static void applyJsonFile(AppConfig &config, const std::string &path);
  static void applyEnvironment(AppConfig &config);
  static CommandLine parse(int argc, char **argv);
  static CommandLine parse(const std::vector<std::string> &argv);

  static std::string usage();
};

} // namespace archiver
