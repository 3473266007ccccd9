#pragma once
#include "MediaFetcher.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archiver {

/**
 * PostStore persists archived posts and their media in SQLite through
 * sqlite_orm. Writes are insert-if-absent so re-archiving a note, or
 * processing a page boundary twice, never duplicates rows. All access goes
 * through one connection guarded by a mutex; no lock is held while media
 * is downloaded. Failures raise StorageError.
 */
class PostStore {
public:
  PostStore(const std::string &dbPath, MediaFetcher &fetcher);
  ~PostStore();

  // Creates missing tables/columns (older stores gain screenshot_path) and
  // records applied migrations. Safe to call repeatedly.
  void initializeSchema();
  std::vector<std::string> appliedMigrations();

  // Returns the new post id, or nullopt when the note is already archived
  // (or carries no id).
  std::optional<std::string> upsertPost(const std::string &instance,
                                        const RemoteNote &note);

  // The only mutation allowed on an existing post. Returns false if the
  // post does not exist.
  bool updateSnapshotPath(const std::string &postId, const std::string &path);

  std::optional<PostRecord> getPost(const std::string &postId);
  std::vector<MediaRecord> listMedia(const std::string &postId);
  std::vector<PostSummary> listPosts();
  std::vector<std::string> listMissingSnapshots();
  int64_t countMissingSnapshots();

  const std::string &mediaRoot() const { return m_fetcher.mediaRoot(); }

  static std::string makePostId(const std::string &instance,
                                const std::string &noteId);

private:
  void upgradeOlderLayout();
  void insertMediaIfAbsent(const MediaRecord &media);

  std::string m_dbPath;
  MediaFetcher &m_fetcher;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace archiver
