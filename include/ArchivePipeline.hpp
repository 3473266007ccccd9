#pragma once

#include "PostStore.hpp"
#include "RemoteClient.hpp"
#include "RenderSnapshotService.hpp"
#include "types.hpp"
#include <chrono>
#include <string>

namespace archiver {

/**
 * ArchivePipeline archives one note, or the public original notes of a
 * user page by page. Newly stored notes get a snapshot when a snapshot
 * service is attached; snapshot failures never fail the archive.
 */
class ArchivePipeline {
public:
  static constexpr int kPageSize = RemoteClient::kMaxPageSize;

  ArchivePipeline(RemoteClient &client, PostStore &store,
                  RenderSnapshotService *snapshots = nullptr,
                  Sleeper sleeper = {},
                  std::chrono::milliseconds pageDelay =
                      std::chrono::milliseconds(1000));

  // Throws RemoteError / StorageError.
  ArchiveOutcome archiveSingle(const std::string &instance,
                               const std::string &noteId);

  // Pages already stored stay stored if a later page fails. Throws
  // InputError for a non-positive maxPosts.
  UserArchiveResult archiveUser(const std::string &instance,
                                const std::string &username, int maxPosts,
                                const ProgressCallback &progress = {});

private:
  bool storeNote(const std::string &instance, const RemoteNote &note);

  RemoteClient &m_client;
  PostStore &m_store;
  RenderSnapshotService *m_snapshots;
  Sleeper m_sleep;
  std::chrono::milliseconds m_pageDelay;
};

} // namespace archiver
