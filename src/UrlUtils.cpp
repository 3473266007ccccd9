#include "UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace archiver {
namespace UrlUtils {

std::optional<ParsedUrl> parse(const std::string &url) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0)
    return std::nullopt;

  ParsedUrl parsed;
  parsed.scheme = url.substr(0, schemeEnd);
  std::transform(parsed.scheme.begin(), parsed.scheme.end(),
                 parsed.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  std::string rest = url.substr(schemeEnd + 3);
  auto hostEnd = rest.find_first_of("/?#");
  parsed.host = rest.substr(0, hostEnd);
  if (parsed.host.empty())
    return std::nullopt;
  if (hostEnd == std::string::npos)
    return parsed;

  std::string tail = rest.substr(hostEnd);
  auto fragment = tail.find('#');
  if (fragment != std::string::npos)
    tail.erase(fragment);
  auto query = tail.find('?');
  if (query != std::string::npos) {
    parsed.query = tail.substr(query + 1);
    tail.erase(query);
  }
  parsed.path = tail;
  return parsed;
}

std::string hostOf(const std::string &instance) {
  auto parsed = parse(instance);
  return parsed ? parsed->host : instance;
}

std::string stripTrailingSlashes(std::string value) {
  while (!value.empty() && value.back() == '/')
    value.pop_back();
  return value;
}

std::string trim(const std::string &value) {
  auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  if (first >= last)
    return "";
  return std::string(first, last);
}

std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

std::pair<std::string, std::string> splitOrigin(const std::string &url) {
  auto parsed = parse(url);
  if (!parsed)
    return {url, "/"};
  std::string pathAndQuery = parsed->path.empty() ? "/" : parsed->path;
  if (!parsed->query.empty())
    pathAndQuery += "?" + parsed->query;
  return {parsed->origin(), pathAndQuery};
}

} // namespace UrlUtils
} // namespace archiver
