#pragma once

#include <optional>
#include <string>
#include <utility>

namespace archiver {

struct ParsedUrl {
  std::string scheme; // lower-case
  std::string host;   // host[:port] as written
  std::string path;   // without query and fragment, may be empty
  std::string query;

  std::string origin() const { return scheme + "://" + host; }
};

namespace UrlUtils {

std::optional<ParsedUrl> parse(const std::string &url);

// "https://host:8443/x" -> "host:8443"; unparseable input is returned as is.
std::string hostOf(const std::string &instance);

std::string stripTrailingSlashes(std::string value);
std::string trim(const std::string &value);
std::string urlEncode(const std::string &value);

// Splits "scheme://host/path?q" into the origin and "/path?q".
std::pair<std::string, std::string> splitOrigin(const std::string &url);

} // namespace UrlUtils

} // namespace archiver
