#include "JobTracker.hpp"
#include "UuidUtils.hpp"
#include <exception>
#include <iostream>

namespace archiver {

JobTracker::JobTracker(ArchivePipeline &pipeline,
                       RenderSnapshotService &snapshots, PostStore &store)
    : m_pipeline(pipeline), m_snapshots(snapshots), m_store(store) {}

JobTracker::~JobTracker() { waitForIdle(); }

void JobTracker::waitForIdle() {
  std::map<uint64_t, std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    workers.swap(m_workers);
    m_finished.clear();
  }
  for (auto &[id, worker] : workers) {
    if (worker.joinable())
      worker.join();
  }
}

std::size_t JobTracker::workerCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_workers.size();
}

// Caller holds m_mutex. A worker marks itself finished in its last locked
// section, so the join only waits for the thread to return.
void JobTracker::reapFinishedLocked() {
  for (uint64_t id : m_finished) {
    auto it = m_workers.find(id);
    if (it == m_workers.end())
      continue;
    if (it->second.joinable())
      it->second.join();
    m_workers.erase(it);
  }
  m_finished.clear();
}

std::string JobTracker::startUserArchive(const std::string &instance,
                                         const std::string &username,
                                         int maxPosts) {
  std::lock_guard<std::mutex> lock(m_mutex);
  reapFinishedLocked();
  std::string jobId;
  do {
    jobId = UuidUtils::shortToken(instance + username, 10);
  } while (m_jobs.count(jobId));
  m_jobs[jobId] = ArchiveJobState{};
  const uint64_t worker = m_nextWorker++;
  m_workers.emplace(worker,
                    std::thread(&JobTracker::runUserArchive, this, worker,
                                jobId, instance, username, maxPosts));
  std::cout << "[Jobs] Started archive job " << jobId << " for @" << username
            << std::endl;
  return jobId;
}

void JobTracker::runUserArchive(uint64_t worker, const std::string &jobId,
                                const std::string &instance,
                                const std::string &username, int maxPosts) {
  auto progress = [this, &jobId](int64_t done, int64_t total) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &job = m_jobs[jobId];
    job.done = done;
    job.total = total;
  };

  try {
    UserArchiveResult result =
        m_pipeline.archiveUser(instance, username, maxPosts, progress);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &job = m_jobs[jobId];
    job.status = JobStatus::Done;
    job.done = result.archived + result.skipped;
    job.total = result.total;
    job.result = result;
    m_finished.push_back(worker);
    std::cout << "[Jobs] Archive job " << jobId << " done" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Jobs] Archive job " << jobId << " failed: " << e.what()
              << std::endl;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &job = m_jobs[jobId];
    job.status = JobStatus::Error;
    job.error = e.what();
    m_finished.push_back(worker);
  }
}

std::optional<ArchiveJobState>
JobTracker::archiveJob(const std::string &jobId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_jobs.find(jobId);
  if (it == m_jobs.end())
    return std::nullopt;
  return it->second;
}

BackfillStartResult JobTracker::startScreenshotBackfill() {
  std::lock_guard<std::mutex> lock(m_mutex);
  reapFinishedLocked();
  BackfillStartResult result;
  if (m_backfill.status == JobStatus::Running) {
    result.outcome = BackfillStart::AlreadyRunning;
    result.state = m_backfill;
    return result;
  }
  const int64_t missing = m_store.countMissingSnapshots();
  if (missing == 0) {
    result.outcome = BackfillStart::NothingToDo;
    result.state = m_backfill;
    return result;
  }
  m_backfill = BackfillJobState{};
  m_backfill.status = JobStatus::Running;
  m_backfill.total = missing;
  const uint64_t worker = m_nextWorker++;
  m_workers.emplace(worker, std::thread(&JobTracker::runBackfill, this, worker));
  std::cout << "[Jobs] Screenshot backfill started for " << missing
            << " post(s)" << std::endl;
  result.outcome = BackfillStart::Started;
  result.state = m_backfill;
  return result;
}

void JobTracker::runBackfill(uint64_t worker) {
  try {
    BackfillResult result =
        m_snapshots.retakeBackfill([this](const BackfillResult &tally) {
          std::lock_guard<std::mutex> lock(m_mutex);
          m_backfill.done = tally.done;
          m_backfill.failed = tally.failed;
          m_backfill.total = tally.total;
        });
    std::lock_guard<std::mutex> lock(m_mutex);
    m_backfill.status = JobStatus::Done;
    m_backfill.done = result.done;
    m_backfill.failed = result.failed;
    m_backfill.total = result.total;
    m_finished.push_back(worker);
  } catch (const std::exception &e) {
    std::cerr << "[Jobs] Screenshot backfill failed: " << e.what()
              << std::endl;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_backfill.status = JobStatus::Error;
    m_backfill.error = e.what();
    m_finished.push_back(worker);
  }
}

BackfillJobState JobTracker::screenshotBackfill() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_backfill;
}

} // namespace archiver
