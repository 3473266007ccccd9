#include "InputResolver.hpp"
#include "ArchiveErrors.hpp"
#include "UrlUtils.hpp"
#include <regex>

namespace archiver {

namespace {

const std::regex kNotePath(R"(/notes/([A-Za-z0-9]+)$)");
const std::regex kCompatPostPath(R"(/(?:posts|statuses)/([A-Za-z0-9]+)$)");
const std::regex kProfilePath(R"(^/@([A-Za-z0-9_.-]+)$)");
const std::regex kHandle(R"(^@?([A-Za-z0-9_.-]+)@([A-Za-z0-9_.-]+\.[A-Za-z]{2,})$)");
const std::regex kBareUsername(R"(^[A-Za-z0-9_.-]+$)");

} // namespace

FetchTarget InputResolver::resolve(const std::string &input) {
  std::string raw = UrlUtils::trim(input);
  auto url = UrlUtils::parse(raw);

  if (url && (url->scheme == "http" || url->scheme == "https")) {
    std::string instance = url->origin();
    std::string path = UrlUtils::stripTrailingSlashes(url->path);
    std::smatch m;

    if (std::regex_search(path, m, kNotePath))
      return NoteTarget{instance, m[1].str()};

    // Mastodon-compatible /@user/posts/<id> and /@user/statuses/<id>
    if (std::regex_search(path, m, kCompatPostPath))
      return NoteTarget{instance, m[1].str()};

    if (std::regex_match(path, m, kProfilePath))
      return UserTarget{instance, m[1].str()};

    throw InputError(InputErrorKind::UnrecognizedLocation,
                     "Cannot extract note or user from URL: " + raw);
  }

  std::smatch m;
  if (std::regex_match(raw, m, kHandle))
    return UserTarget{"https://" + m[2].str(), m[1].str()};

  if (std::regex_match(raw, kBareUsername))
    return UserTarget{std::nullopt, raw};

  throw InputError(InputErrorKind::UnrecognizedInput,
                   "Unrecognised input: " + raw);
}

std::string InputResolver::normalizeInstance(const std::string &instance) {
  std::string value = UrlUtils::stripTrailingSlashes(UrlUtils::trim(instance));
  if (value.empty())
    return value;
  if (value.rfind("http://", 0) != 0 && value.rfind("https://", 0) != 0)
    value = "https://" + value;
  auto parsed = UrlUtils::parse(value);
  return parsed ? parsed->origin() : value;
}

std::string InputResolver::resolveInstance(const FetchTarget &target,
                                           const std::string &instanceOverride) {
  std::optional<std::string> carried;
  if (auto note = std::get_if<NoteTarget>(&target))
    carried = note->instance;
  else
    carried = std::get<UserTarget>(target).instance;

  std::string instance =
      normalizeInstance(carried && !carried->empty() ? *carried : instanceOverride);
  if (instance.empty())
    throw InputError(InputErrorKind::InstanceRequired,
                     "Instance URL required: include it in the URL/handle, or "
                     "supply the instance separately.");
  return instance;
}

} // namespace archiver
