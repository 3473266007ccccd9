#include "NoteParser.hpp"

using json = nlohmann::json;

namespace archiver {

namespace {

const json &member(const json &object, const char *key) {
  static const json kNull;
  if (!object.is_object())
    return kNull;
  auto it = object.find(key);
  return it == object.end() ? kNull : *it;
}

std::string stringOr(const json &object, const char *key,
                     const std::string &fallback = "") {
  const json &value = member(object, key);
  return value.is_string() ? value.get<std::string>() : fallback;
}

std::optional<std::string> optionalString(const json &object, const char *key) {
  const json &value = member(object, key);
  if (value.is_string())
    return value.get<std::string>();
  return std::nullopt;
}

std::optional<int64_t> optionalInt(const json &object, const char *key) {
  const json &value = member(object, key);
  if (value.is_number_integer())
    return value.get<int64_t>();
  if (value.is_number_float())
    return static_cast<int64_t>(value.get<double>());
  return std::nullopt;
}

RemoteFile parseFile(const json &file) {
  RemoteFile f;
  f.id = optionalString(file, "id");
  if (f.id && f.id->empty())
    f.id.reset();
  f.url = stringOr(file, "url");
  f.name = stringOr(file, "name");
  f.type = stringOr(file, "type");
  const json &properties = member(file, "properties");
  f.width = optionalInt(properties, "width");
  f.height = optionalInt(properties, "height");
  const json &sensitive = member(file, "isSensitive");
  f.isSensitive = sensitive.is_boolean() && sensitive.get<bool>();
  f.comment = stringOr(file, "comment");
  return f;
}

} // namespace

int64_t sumReactions(const json &reactions) {
  if (!reactions.is_object())
    return 0;
  int64_t total = 0;
  for (const auto &entry : reactions.items()) {
    const json &count = entry.value();
    if (count.is_number_integer())
      total += count.get<int64_t>();
    else if (count.is_number_float())
      total += static_cast<int64_t>(count.get<double>());
  }
  return total;
}

RemoteNote parseRemoteNote(const json &note) {
  RemoteNote n;
  n.id = stringOr(note, "id");

  const json &user = member(note, "user");
  n.user.username = stringOr(user, "username");
  n.user.name = stringOr(user, "name");
  n.user.host = optionalString(user, "host");
  if (n.user.host && n.user.host->empty())
    n.user.host.reset();
  n.user.avatarUrl = stringOr(user, "avatarUrl");

  n.text = stringOr(note, "text");
  n.cw = optionalString(note, "cw");
  n.createdAt = stringOr(note, "createdAt");
  n.repliesCount = optionalInt(note, "repliesCount").value_or(0);
  n.renoteCount = optionalInt(note, "renoteCount").value_or(0);
  n.reactionCount = sumReactions(member(note, "reactions"));
  n.visibility = stringOr(note, "visibility", "public");

  const json &files = member(note, "files");
  if (files.is_array()) {
    for (const auto &file : files) {
      if (file.is_object())
        n.files.push_back(parseFile(file));
    }
  }

  n.rawJson = note.dump();
  return n;
}

} // namespace archiver
