#pragma once

#include "ArchivePipeline.hpp"
#include "PostStore.hpp"
#include "RenderSnapshotService.hpp"
#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace archiver {

/**
 * JobTracker runs bulk work on its own worker threads and keeps a polled
 * progress record per job. User archives may run concurrently; at most one
 * screenshot backfill runs at a time. Records live for the process
 * lifetime.
 */
class JobTracker {
public:
  JobTracker(ArchivePipeline &pipeline, RenderSnapshotService &snapshots,
             PostStore &store);
  ~JobTracker();

  JobTracker(const JobTracker &) = delete;
  JobTracker &operator=(const JobTracker &) = delete;

  std::string startUserArchive(const std::string &instance,
                               const std::string &username, int maxPosts);
  std::optional<ArchiveJobState> archiveJob(const std::string &jobId) const;

  BackfillStartResult startScreenshotBackfill();
  BackfillJobState screenshotBackfill() const;

  // Joins every worker started so far.
  void waitForIdle();
  // Threads not yet joined. Finished workers are joined on the next start.
  std::size_t workerCount() const;

private:
  void runUserArchive(uint64_t worker, const std::string &jobId,
                      const std::string &instance, const std::string &username,
                      int maxPosts);
  void runBackfill(uint64_t worker);
  void reapFinishedLocked();

  ArchivePipeline &m_pipeline;
  RenderSnapshotService &m_snapshots;
  PostStore &m_store;

  mutable std::mutex m_mutex;
  std::map<std::string, ArchiveJobState> m_jobs;
  BackfillJobState m_backfill;
  std::map<uint64_t, std::thread> m_workers;
  std::vector<uint64_t> m_finished;
  uint64_t m_nextWorker = 0;
};

} // namespace archiver
