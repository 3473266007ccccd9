#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace archiver {

// Fetch targets produced by InputResolver
struct NoteTarget {
  std::string instance; // "https://host", no trailing slash
  std::string noteId;
};

struct UserTarget {
  std::optional<std::string> instance; // unset for a bare username
  std::string username;
};

using FetchTarget = std::variant<NoteTarget, UserTarget>;

// Remote note as consumed from the API. Every field has a default so a
// partial or oddly typed payload never fails the mapping.
struct RemoteFile {
  std::optional<std::string> id;
  std::string url;
  std::string name;
  std::string type;
  std::optional<int64_t> width;
  std::optional<int64_t> height;
  bool isSensitive = false;
  std::string comment;
};

struct RemoteAuthor {
  std::string name;
  std::string username;
  std::optional<std::string> host;
  std::string avatarUrl;
};

struct RemoteNote {
  std::string id;
  RemoteAuthor user;
  std::string text;
  std::optional<std::string> cw;
  std::string createdAt;
  int64_t repliesCount = 0;
  int64_t renoteCount = 0;
  int64_t reactionCount = 0;
  std::string visibility = "public";
  std::vector<RemoteFile> files;
  std::string rawJson; // the note object exactly as received
};

// Persistent rows
struct PostRecord {
  std::string id; // "<instance host>/<note id>"
  std::string instance;
  std::string noteId;
  std::string url;
  std::string archivedAt;
  std::string userName;
  std::string userHandle;
  std::string userAvatar;
  std::string content;
  std::optional<std::string> cw;
  std::string createdAt;
  int64_t replyCount = 0;
  int64_t renoteCount = 0;
  int64_t reactionCount = 0;
  std::string visibility;
  std::string rawJson;
  std::optional<std::string> screenshotPath;
};

struct MediaRecord {
  std::string id; // "<post id>/<attachment id>"
  std::string postId;
  std::string filename;
  std::string url;
  std::string mimeType;
  std::optional<std::string> localPath;
  std::optional<int64_t> width;
  std::optional<int64_t> height;
  bool isSensitive = false;
  std::string altText;
};

struct MigrationRecord {
  std::string id;
  std::optional<std::string> appliedAt;
};

struct PostSummary {
  PostRecord post;
  int64_t mediaCount = 0;
};

// Pipeline results
enum class ArchiveStatus { Archived, AlreadyArchived };

struct ArchiveOutcome {
  ArchiveStatus status = ArchiveStatus::Archived;
  std::string postId;
  std::optional<std::string> url;
};

struct UserArchiveResult {
  std::string user;
  std::string instance;
  int64_t archived = 0;
  int64_t skipped = 0;
  int64_t total = 0;
};

struct BackfillResult {
  int64_t done = 0;
  int64_t failed = 0;
  int64_t total = 0;
};

// Background job records
enum class JobStatus { Idle, Running, Done, Error };

struct ArchiveJobState {
  JobStatus status = JobStatus::Running;
  int64_t done = 0;
  int64_t total = 0;
  std::optional<UserArchiveResult> result;
  std::optional<std::string> error;
};

struct BackfillJobState {
  JobStatus status = JobStatus::Idle;
  int64_t done = 0;
  int64_t failed = 0;
  int64_t total = 0;
  std::optional<std::string> error;
};

enum class BackfillStart { Started, AlreadyRunning, NothingToDo };

struct BackfillStartResult {
  BackfillStart outcome = BackfillStart::Started;
  BackfillJobState state;
};

// Export bundle entry: a named byte blob
struct BundleEntry {
  std::string name;
  std::string bytes;
};

using ProgressCallback = std::function<void(int64_t done, int64_t total)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

const char *toString(JobStatus status);
const char *toString(ArchiveStatus status);

} // namespace archiver
