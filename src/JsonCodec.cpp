#include "JsonCodec.hpp"

using json = nlohmann::json;

namespace archiver {

namespace {

template <typename T> json optionalValue(const std::optional<T> &value) {
  return value ? json(*value) : json(nullptr);
}

} // namespace

void to_json(json &j, const PostRecord &post) {
  j = json{{"id", post.id},
           {"instance", post.instance},
           {"note_id", post.noteId},
           {"url", post.url},
           {"archived_at", post.archivedAt},
           {"user_name", post.userName},
           {"user_handle", post.userHandle},
           {"user_avatar", post.userAvatar},
           {"content", post.content},
           {"cw", optionalValue(post.cw)},
           {"created_at", post.createdAt},
           {"reply_count", post.replyCount},
           {"renote_count", post.renoteCount},
           {"reaction_count", post.reactionCount},
           {"visibility", post.visibility},
           {"raw_json", post.rawJson},
           {"screenshot_path", optionalValue(post.screenshotPath)}};
}

void to_json(json &j, const MediaRecord &media) {
  j = json{{"id", media.id},
           {"post_id", media.postId},
           {"filename", media.filename},
           {"url", media.url},
           {"mime_type", media.mimeType},
           {"local_path", optionalValue(media.localPath)},
           {"width", optionalValue(media.width)},
           {"height", optionalValue(media.height)},
           {"is_sensitive", media.isSensitive},
           {"alt_text", media.altText}};
}

void to_json(json &j, const PostSummary &summary) {
  to_json(j, summary.post);
  // The listing never ships the raw payload.
  j.erase("raw_json");
  j["media_count"] = summary.mediaCount;
}

void to_json(json &j, const ArchiveOutcome &outcome) {
  j = json{{"status", toString(outcome.status)}, {"post_id", outcome.postId}};
  if (outcome.url)
    j["url"] = *outcome.url;
}

void to_json(json &j, const UserArchiveResult &result) {
  j = json{{"user", result.user},
           {"instance", result.instance},
           {"archived", result.archived},
           {"skipped", result.skipped},
           {"total", result.total}};
}

void to_json(json &j, const BackfillResult &result) {
  j = json{{"done", result.done},
           {"failed", result.failed},
           {"total", result.total}};
}

void to_json(json &j, const ArchiveJobState &state) {
  j = json{{"status", toString(state.status)},
           {"done", state.done},
           {"total", state.total}};
  if (state.result)
    j["result"] = *state.result;
  if (state.error)
    j["error"] = *state.error;
}

void to_json(json &j, const BackfillJobState &state) {
  j = json{{"status", toString(state.status)},
           {"done", state.done},
           {"failed", state.failed},
           {"total", state.total}};
  if (state.error)
    j["error"] = *state.error;
}

void to_json(json &j, const BackfillStartResult &start) {
  switch (start.outcome) {
  case BackfillStart::Started:
    j = json{{"status", "started"}, {"total", start.state.total}};
    break;
  case BackfillStart::AlreadyRunning:
    j = json{{"status", "already_running"}, {"state", start.state}};
    break;
  case BackfillStart::NothingToDo:
    j = json{{"status", "nothing_to_do"}, {"message", "All posts already have snapshots"}};
    break;
  }
}

} // namespace archiver
