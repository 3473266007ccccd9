#include "AppConfig.hpp"
#include "ArchiveErrors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace archiver {

namespace {

InputError invalid(const std::string &message) {
  return InputError(InputErrorKind::InvalidArgument, message);
}

int parseInt(const std::string &value, const std::string &what) {
  std::size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &used);
  } catch (const std::exception &) {
    throw invalid(what + " must be an integer, got '" + value + "'");
  }
  if (used != value.size())
    throw invalid(what + " must be an integer, got '" + value + "'");
  return parsed;
}

void readString(const json &doc, const char *key, std::string &out) {
  if (!doc.contains(key))
    return;
  if (!doc[key].is_string())
    throw invalid(std::string("config key '") + key + "' must be a string");
  out = doc[key].get<std::string>();
}

void readInt(const json &doc, const char *key, int &out) {
  if (!doc.contains(key))
    return;
  if (!doc[key].is_number_integer())
    throw invalid(std::string("config key '") + key + "' must be an integer");
  out = doc[key].get<int>();
}

void requirePositive(int value, const std::string &what) {
  if (value <= 0)
    throw invalid(what + " must be positive");
}

const std::map<std::string, std::string> kValueFlags = {
    {"--config", "config"},     {"--data-dir", "data-dir"},
    {"--port", "port"},         {"--browser", "browser"},
    {"--max-posts", "max-posts"}, {"--instance", "instance"}};

} // namespace

std::string AppConfig::databasePath() const {
  if (!dbPath.empty())
    return dbPath;
  return (fs::path(dataDir) / "archive.db").string();
}

std::string AppConfig::mediaPath() const {
  if (!mediaDir.empty())
    return mediaDir;
  return (fs::path(dataDir) / "media").string();
}

void ConfigLoader::applyJsonFile(AppConfig &config, const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw invalid("cannot open config file " + path);
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw invalid("config file " + path + " is not a JSON object");

  readString(doc, "data_dir", config.dataDir);
  readString(doc, "db_path", config.dbPath);
  readString(doc, "media_dir", config.mediaDir);
  readString(doc, "host", config.host);
  readInt(doc, "port", config.port);
  readString(doc, "browser", config.browser);
  readString(doc, "instance", config.defaultInstance);
  readInt(doc, "max_posts", config.maxPosts);
  readInt(doc, "remote_attempts", config.remoteAttempts);
  readInt(doc, "remote_timeout_seconds", config.remoteTimeoutSeconds);
  readInt(doc, "page_delay_ms", config.pageDelayMs);
  std::cout << "[Config] Loaded " << path << std::endl;
}

void ConfigLoader::applyEnvironment(AppConfig &config) {
  if (const char *dir = std::getenv("ARCHIVER_DATA_DIR"); dir && *dir)
    config.dataDir = dir;
  if (const char *port = std::getenv("ARCHIVER_PORT"); port && *port)
    config.port = parseInt(port, "ARCHIVER_PORT");
  if (const char *browser = std::getenv("ARCHIVER_BROWSER");
      browser && *browser)
    config.browser = browser;
}

CommandLine ConfigLoader::parse(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i)
    args.emplace_back(argv[i]);
  return parse(args);
}

CommandLine ConfigLoader::parse(const std::vector<std::string> &argv) {
  CommandLine cmd;
  std::map<std::string, std::string> flags;
  std::vector<std::string> positional;

  for (std::size_t i = 0; i < argv.size(); ++i) {
    const std::string &arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      cmd.showHelp = true;
      continue;
    }
    if (arg.rfind("--", 0) == 0) {
      std::string name = arg;
      std::optional<std::string> value;
      if (auto eq = arg.find('='); eq != std::string::npos) {
        name = arg.substr(0, eq);
        value = arg.substr(eq + 1);
      }
      auto flag = kValueFlags.find(name);
      if (flag == kValueFlags.end())
        throw invalid("unknown option " + name);
      if (!value) {
        if (i + 1 >= argv.size())
          throw invalid("option " + name + " needs a value");
        value = argv[++i];
      }
      flags[flag->second] = *value;
      continue;
    }
    positional.push_back(arg);
  }

  AppConfig &config = cmd.config;
  if (auto it = flags.find("config"); it != flags.end())
    applyJsonFile(config, it->second);
  applyEnvironment(config);
  if (auto it = flags.find("data-dir"); it != flags.end())
    config.dataDir = it->second;
  if (auto it = flags.find("port"); it != flags.end())
    config.port = parseInt(it->second, "--port");
  if (auto it = flags.find("browser"); it != flags.end())
    config.browser = it->second;
  if (auto it = flags.find("max-posts"); it != flags.end())
    config.maxPosts = parseInt(it->second, "--max-posts");
  if (auto it = flags.find("instance"); it != flags.end())
    config.defaultInstance = it->second;

  requirePositive(config.port, "port");
  requirePositive(config.maxPosts, "max posts");
  requirePositive(config.remoteAttempts, "remote attempts");
  requirePositive(config.remoteTimeoutSeconds, "remote timeout");
  if (config.pageDelayMs < 0)
    throw invalid("page delay must not be negative");

  if (!positional.empty()) {
    cmd.command = positional.front();
    cmd.args.assign(positional.begin() + 1, positional.end());
  }
  static const std::map<std::string, std::size_t> kArity = {
      {"serve", 0}, {"archive", 1}, {"retake", 0}, {"list", 0}, {"export", 2}};
  auto arity = kArity.find(cmd.command);
  if (arity == kArity.end())
    throw invalid("unknown command '" + cmd.command + "'");
  if (!cmd.showHelp && cmd.args.size() != arity->second)
    throw invalid("command '" + cmd.command + "' takes " +
                  std::to_string(arity->second) + " argument(s)");
  return cmd;
}

std::string ConfigLoader::usage() {
  return "Usage: note-archiver [options] [command]\n"
         "\n"
         "Commands:\n"
         "  serve                   run the local web interface (default)\n"
         "  archive <input>         archive a post URL, profile URL or handle\n"
         "  retake                  snapshot every post that lacks one\n"
         "  list                    print archived posts as JSON\n"
         "  export <post-id> <dir>  write a post bundle to a directory\n"
         "\n"
         "Options:\n"
         "  --config <file>     JSON configuration file\n"
         "  --data-dir <dir>    archive location (default archive_data)\n"
         "  --port <n>          first port to try (default 5757)\n"
         "  --browser <path>    headless Chromium/Chrome binary\n"
         "  --max-posts <n>     posts per user archive (default 500)\n"
         "  --instance <url>    instance for bare usernames\n"
         "  -h, --help          show this help\n";
}

} // namespace archiver
