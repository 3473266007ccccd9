#include "PostStore.hpp"
#include "ArchiveErrors.hpp"
#include "UrlUtils.hpp"
#include "UuidUtils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>
#include <sstream>
#include <system_error>

using namespace sqlite_orm;

namespace archiver {

namespace {

// Migrations recorded in _migrations, in the order they were introduced.
const char *const kMigrations[] = {
    "0001_posts_media",
    "0002_posts_screenshot_path",
};

std::string utcTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch()) %
                std::chrono::seconds(1);
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(6) << micros.count() << 'Z';
  return out.str();
}

// Older archive.db files declare most text columns nullable and give the
// counters a DEFAULT 0. sqlite_orm treats that as a different layout and
// would rebuild the table, copying NULLs into NOT NULL columns. Those
// stores are upgraded in place instead: missing tables are created in the
// older layout and missing columns are appended.
const char *const kOlderLayout[] = {
    "CREATE TABLE IF NOT EXISTS posts (id TEXT PRIMARY KEY, "
    "instance TEXT NOT NULL, note_id TEXT NOT NULL, url TEXT NOT NULL, "
    "archived_at TEXT NOT NULL, user_name TEXT, user_handle TEXT, "
    "user_avatar TEXT, content TEXT, cw TEXT, created_at TEXT, "
    "reply_count INTEGER DEFAULT 0, renote_count INTEGER DEFAULT 0, "
    "reaction_count INTEGER DEFAULT 0, visibility TEXT, raw_json TEXT)",
    "CREATE TABLE IF NOT EXISTS _migrations (id TEXT PRIMARY KEY)",
    "CREATE TABLE IF NOT EXISTS media (id TEXT PRIMARY KEY, "
    "post_id TEXT NOT NULL, filename TEXT NOT NULL, url TEXT NOT NULL, "
    "mime_type TEXT, local_path TEXT, width INTEGER, height INTEGER, "
    "is_sensitive INTEGER DEFAULT 0, alt_text TEXT, "
    "FOREIGN KEY (post_id) REFERENCES posts(id))",
};

struct AddedColumn {
  const char *table;
  const char *column;
  const char *type;
};

const AddedColumn kAddedColumns[] = {
    {"posts", "screenshot_path", "TEXT"},
    {"_migrations", "applied_at", "TEXT"},
};

class RawConnection {
public:
  explicit RawConnection(const std::string &path) {
    if (sqlite3_open_v2(path.c_str(), &m_db, SQLITE_OPEN_READWRITE, nullptr) !=
        SQLITE_OK) {
      std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
      sqlite3_close(m_db);
      throw StorageError("Cannot open " + path + ": " + message);
    }
  }
  ~RawConnection() { sqlite3_close(m_db); }
  RawConnection(const RawConnection &) = delete;
  RawConnection &operator=(const RawConnection &) = delete;

  void exec(const std::string &sql) {
    char *err = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err);
    std::string message = err ? err : "";
    sqlite3_free(err);
    if (rc != SQLITE_OK)
      throw StorageError("Statement failed (" + sql + "): " + message);
  }

  bool hasColumn(const std::string &table, const std::string &column) {
    const std::string sql = "PRAGMA table_info(\"" + table + "\")";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
      throw StorageError("Cannot inspect " + table + ": " + sqlite3_errmsg(m_db));
    bool found = false;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
      auto name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
      if (name && column == name) {
        found = true;
        break;
      }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
      throw StorageError("Cannot inspect " + table + ": " + sqlite3_errmsg(m_db));
    return found;
  }

private:
  sqlite3 *m_db = nullptr;
};

bool needsRebuild(sync_schema_result result) {
  return result == sync_schema_result::dropped_and_recreated ||
         result == sync_schema_result::old_columns_removed ||
         result == sync_schema_result::new_columns_added_and_old_columns_removed;
}

} // namespace

// Table layout of archive.db. Also used to name the storage type below.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<PostRecord>(
          "posts", make_column("id", &PostRecord::id, primary_key()),
          make_column("instance", &PostRecord::instance),
          make_column("note_id", &PostRecord::noteId),
          make_column("url", &PostRecord::url),
          make_column("archived_at", &PostRecord::archivedAt),
          make_column("user_name", &PostRecord::userName),
          make_column("user_handle", &PostRecord::userHandle),
          make_column("user_avatar", &PostRecord::userAvatar),
          make_column("content", &PostRecord::content),
          make_column("cw", &PostRecord::cw),
          make_column("created_at", &PostRecord::createdAt),
          make_column("reply_count", &PostRecord::replyCount),
          make_column("renote_count", &PostRecord::renoteCount),
          make_column("reaction_count", &PostRecord::reactionCount),
          make_column("visibility", &PostRecord::visibility),
          make_column("raw_json", &PostRecord::rawJson),
          make_column("screenshot_path", &PostRecord::screenshotPath)),
      make_table<MediaRecord>(
          "media", make_column("id", &MediaRecord::id, primary_key()),
          make_column("post_id", &MediaRecord::postId),
          make_column("filename", &MediaRecord::filename),
          make_column("url", &MediaRecord::url),
          make_column("mime_type", &MediaRecord::mimeType),
          make_column("local_path", &MediaRecord::localPath),
          make_column("width", &MediaRecord::width),
          make_column("height", &MediaRecord::height),
          make_column("is_sensitive", &MediaRecord::isSensitive),
          make_column("alt_text", &MediaRecord::altText),
          foreign_key(&MediaRecord::postId).references(&PostRecord::id)),
      make_table<MigrationRecord>(
          "_migrations",
          make_column("id", &MigrationRecord::id, primary_key()),
          make_column("applied_at", &MigrationRecord::appliedAt)));
}

using Storage = decltype(create_storage_impl(""));

struct PostStore::Impl {
  Storage storage;
  std::mutex mutex;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {
    storage.open_forever();
  }
};

PostStore::PostStore(const std::string &dbPath, MediaFetcher &fetcher)
    : m_dbPath(dbPath), m_fetcher(fetcher),
      m_impl(std::make_unique<Impl>(dbPath)) {}

PostStore::~PostStore() = default;

std::string PostStore::makePostId(const std::string &instance,
                                  const std::string &noteId) {
  return UrlUtils::hostOf(instance) + "/" + noteId;
}

void PostStore::initializeSchema() {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  std::cout << "[DB] Synchronizing schema via sqlite_orm: " << m_dbPath
            << std::endl;
  try {
    bool olderLayout = false;
    for (const auto &[table, result] :
         m_impl->storage.sync_schema_simulate(true)) {
      if (needsRebuild(result))
        olderLayout = true;
    }
    if (olderLayout) {
      std::cout << "[DB] Older table layout found, upgrading in place"
                << std::endl;
      upgradeOlderLayout();
    } else {
      auto results = m_impl->storage.sync_schema(true);
      for (const auto &[table, result] : results) {
        if (result != sync_schema_result::already_in_sync)
          std::cout << "[DB] " << table << ": " << result << std::endl;
      }
    }
    for (const char *id : kMigrations) {
      if (m_impl->storage.get_optional<MigrationRecord>(std::string(id)))
        continue;
      m_impl->storage.replace(MigrationRecord{id, utcTimestamp()});
      std::cout << "[DB] Applied migration " << id << std::endl;
    }
  } catch (const std::system_error &e) {
    throw StorageError("Schema synchronization failed for " + m_dbPath + ": " +
                       e.what());
  }
  std::cout << "[DB] Schema synchronized successfully." << std::endl;
}

void PostStore::upgradeOlderLayout() {
  RawConnection db(m_dbPath);
  for (const char *sql : kOlderLayout)
    db.exec(sql);
  for (const auto &added : kAddedColumns) {
    if (db.hasColumn(added.table, added.column))
      continue;
    db.exec(std::string("ALTER TABLE ") + added.table + " ADD COLUMN " +
            added.column + " " + added.type);
    std::cout << "[DB] Added column " << added.table << "." << added.column
              << std::endl;
  }
}

std::vector<std::string> PostStore::appliedMigrations() {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    return m_impl->storage.select(&MigrationRecord::id,
                                  order_by(&MigrationRecord::id));
  } catch (const std::system_error &e) {
    throw StorageError(std::string("Reading migrations failed: ") + e.what());
  }
}

std::optional<std::string> PostStore::upsertPost(const std::string &instance,
                                                 const RemoteNote &note) {
  if (note.id.empty()) {
    std::cerr << "[DB] Ignoring note without id from " << instance << std::endl;
    return std::nullopt;
  }

  const std::string postId = makePostId(instance, note.id);

  PostRecord post;
  post.id = postId;
  post.instance = instance;
  post.noteId = note.id;
  post.url = UrlUtils::stripTrailingSlashes(instance) + "/notes/" + note.id;
  post.archivedAt = utcTimestamp();
  post.userName = note.user.name.empty() ? note.user.username : note.user.name;
  post.userHandle = "@" + note.user.username;
  if (note.user.host)
    post.userHandle += "@" + *note.user.host;
  post.userAvatar = note.user.avatarUrl;
  post.content = note.text;
  post.cw = note.cw;
  post.createdAt = note.createdAt;
  post.replyCount = note.repliesCount;
  post.renoteCount = note.renoteCount;
  post.reactionCount = note.reactionCount;
  post.visibility = note.visibility;
  post.rawJson = note.rawJson;

  {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    try {
      if (m_impl->storage.get_pointer<PostRecord>(postId))
        return std::nullopt; // already archived
      m_impl->storage.replace(post);
    } catch (const std::system_error &e) {
      throw StorageError("Inserting post " + postId + " failed: " + e.what());
    }
  }

  const std::string bucket = MediaFetcher::sanitizeBucket(postId);
  for (const auto &file : note.files) {
    std::string fid = file.id ? *file.id : UuidUtils::shortHash(file.url, 10);
    MediaRecord media;
    media.id = postId + "/" + fid;
    media.postId = postId;
    media.filename = file.name.empty() ? fid : file.name;
    media.url = file.url;
    media.mimeType = file.type;
    if (!file.url.empty())
      media.localPath = m_fetcher.fetch(file.url, bucket, fid);
    media.width = file.width;
    media.height = file.height;
    media.isSensitive = file.isSensitive;
    media.altText = file.comment;
    insertMediaIfAbsent(media);
  }

  std::cout << "[DB] Archived post " << postId << " with " << note.files.size()
            << " attachment(s)" << std::endl;
  return postId;
}

void PostStore::insertMediaIfAbsent(const MediaRecord &media) {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    if (m_impl->storage.get_pointer<MediaRecord>(media.id))
      return;
    m_impl->storage.replace(media);
  } catch (const std::system_error &e) {
    throw StorageError("Inserting media " + media.id + " failed: " + e.what());
  }
}

bool PostStore::updateSnapshotPath(const std::string &postId,
                                   const std::string &path) {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    if (!m_impl->storage.get_pointer<PostRecord>(postId))
      return false;
    m_impl->storage.update_all(set(c(&PostRecord::screenshotPath) = path),
                               where(c(&PostRecord::id) == postId));
    return true;
  } catch (const std::system_error &e) {
    throw StorageError("Updating snapshot of " + postId + " failed: " + e.what());
  }
}

std::optional<PostRecord> PostStore::getPost(const std::string &postId) {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    return m_impl->storage.get_optional<PostRecord>(postId);
  } catch (const std::system_error &e) {
    throw StorageError("Reading post " + postId + " failed: " + e.what());
  }
}

std::vector<MediaRecord> PostStore::listMedia(const std::string &postId) {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    return m_impl->storage.get_all<MediaRecord>(
        where(c(&MediaRecord::postId) == postId));
  } catch (const std::system_error &e) {
    throw StorageError("Reading media of " + postId + " failed: " + e.what());
  }
}

std::vector<PostSummary> PostStore::listPosts() {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    std::map<std::string, int64_t> mediaCounts;
    auto counts = m_impl->storage.select(
        columns(&MediaRecord::postId, count(&MediaRecord::id)),
        group_by(&MediaRecord::postId));
    for (const auto &row : counts)
      mediaCounts[std::get<0>(row)] = std::get<1>(row);

    std::vector<PostSummary> result;
    for (auto &post : m_impl->storage.get_all<PostRecord>(
             order_by(&PostRecord::archivedAt).desc())) {
      PostSummary summary;
      auto it = mediaCounts.find(post.id);
      summary.mediaCount = it == mediaCounts.end() ? 0 : it->second;
      summary.post = std::move(post);
      result.push_back(std::move(summary));
    }
    return result;
  } catch (const std::system_error &e) {
    throw StorageError(std::string("Listing posts failed: ") + e.what());
  }
}

std::vector<std::string> PostStore::listMissingSnapshots() {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    return m_impl->storage.select(
        &PostRecord::id,
        where(or_(is_null(&PostRecord::screenshotPath),
                  c(&PostRecord::screenshotPath) == std::string())),
        order_by(&PostRecord::archivedAt));
  } catch (const std::system_error &e) {
    throw StorageError(std::string("Listing missing snapshots failed: ") +
                       e.what());
  }
}

int64_t PostStore::countMissingSnapshots() {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  try {
    return m_impl->storage.count<PostRecord>(
        where(or_(is_null(&PostRecord::screenshotPath),
                  c(&PostRecord::screenshotPath) == std::string())));
  } catch (const std::system_error &e) {
    throw StorageError(std::string("Counting missing snapshots failed: ") +
                       e.what());
  }
}

} // namespace archiver
