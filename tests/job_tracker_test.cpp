#include <gtest/gtest.h>

#include "JobTracker.hpp"
#include "NoteParser.hpp"
#include "test_support.hpp"
#include <chrono>
#include <condition_variable>
#include <future>
#include <thread>

using namespace archiver;
using namespace archiver::test;
using json = nlohmann::json;

namespace {

const std::string kInstance = "https://ex.social";

bool endsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

HttpResponse timeline(const RecordedCall &call) {
  if (endsWith(call.url, "/api/users/show"))
    return jsonResponse(json{{"id", "u1"}});
  if (endsWith(call.url, "/api/users/notes"))
    return jsonResponse(json::array({makeNote("n1"), makeNote("n2")}));
  return HttpResponse{404, "", "text/plain"};
}

// Holds every capture until release() is called.
class Gate {
public:
  void wait() {
    std::unique_lock<std::mutex> lock(m_mutex);
    ++m_waiting;
    m_cv.notify_all();
    m_cv.wait(lock, [this] { return m_open; });
  }
  void waitForFirstArrival() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_waiting > 0; });
  }
  void release() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = true;
    m_cv.notify_all();
  }

private:
  std::mutex m_mutex;
  std::condition_variable m_cv;
  int m_waiting = 0;
  bool m_open = false;
};

struct TrackerFixture : ::testing::Test {
  TempDir dir;
  FakeTransport transport{timeline};
  RecordingSleeper sleeper;
  RemoteClient client{transport, RetryPolicy{}, sleeper.sleeper()};
  MediaFetcher fetcher{transport, dir.str("media")};
  PostStore store{dir.str("archive.db"), fetcher};
  RenderRegistry registry;
  FakeRenderer renderer;
  RenderSnapshotService snapshots{store, registry, &renderer,
                                  "http://127.0.0.1:5757"};
  ArchivePipeline pipeline{client, store, nullptr, sleeper.sleeper()};
  std::unique_ptr<JobTracker> jobs;

  void SetUp() override {
    store.initializeSchema();
    jobs = std::make_unique<JobTracker>(pipeline, snapshots, store);
  }
  void TearDown() override { jobs.reset(); }
};

} // namespace

TEST_F(TrackerFixture, UserArchiveJobReachesDone) {
  const std::string id = jobs->startUserArchive(kInstance, "alice", 10);
  EXPECT_EQ(id.size(), 10u);
  jobs->waitForIdle();

  auto state = jobs->archiveJob(id);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->status, JobStatus::Done);
  EXPECT_EQ(state->done, 2);
  EXPECT_EQ(state->total, 2);
  ASSERT_TRUE(state->result.has_value());
  EXPECT_EQ(state->result->archived, 2);
  EXPECT_FALSE(state->error.has_value());
}

TEST_F(TrackerFixture, UserArchiveJobReachesError) {
  transport.setHandler([](const RecordedCall &) {
    return HttpResponse{404, "no such user", "text/plain"};
  });
  const std::string id = jobs->startUserArchive(kInstance, "ghost", 10);
  jobs->waitForIdle();

  auto state = jobs->archiveJob(id);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->status, JobStatus::Error);
  ASSERT_TRUE(state->error.has_value());
  EXPECT_NE(state->error->find("404"), std::string::npos);
  EXPECT_FALSE(state->result.has_value());
}

TEST_F(TrackerFixture, UnknownJobIsAbsent) {
  EXPECT_FALSE(jobs->archiveJob("nope").has_value());
}

TEST_F(TrackerFixture, JobIdsAreDistinct) {
  auto a = jobs->startUserArchive(kInstance, "alice", 1);
  auto b = jobs->startUserArchive(kInstance, "alice", 1);
  EXPECT_NE(a, b);
  jobs->waitForIdle();
}

TEST_F(TrackerFixture, BackfillWithNothingMissing) {
  auto start = jobs->startScreenshotBackfill();
  EXPECT_EQ(start.outcome, BackfillStart::NothingToDo);
  EXPECT_EQ(jobs->screenshotBackfill().status, JobStatus::Idle);
  EXPECT_TRUE(renderer.requests().empty());
}

TEST_F(TrackerFixture, BackfillStartWhileRunningReturnsExistingState) {
  ASSERT_TRUE(store.upsertPost(kInstance, parseRemoteNote(makeNote("a"))));
  ASSERT_TRUE(store.upsertPost(kInstance, parseRemoteNote(makeNote("b"))));

  Gate gate;
  renderer.onCapture = [&gate](const CaptureRequest &) { gate.wait(); };

  auto first = jobs->startScreenshotBackfill();
  EXPECT_EQ(first.outcome, BackfillStart::Started);
  EXPECT_EQ(first.state.total, 2);
  gate.waitForFirstArrival();

  auto second = jobs->startScreenshotBackfill();
  EXPECT_EQ(second.outcome, BackfillStart::AlreadyRunning);
  EXPECT_EQ(second.state.status, JobStatus::Running);
  EXPECT_EQ(second.state.total, 2);

  gate.release();
  jobs->waitForIdle();

  auto state = jobs->screenshotBackfill();
  EXPECT_EQ(state.status, JobStatus::Done);
  EXPECT_EQ(state.done, 2);
  EXPECT_EQ(state.failed, 0);
  EXPECT_EQ(renderer.requests().size(), 2u);

  auto third = jobs->startScreenshotBackfill();
  EXPECT_EQ(third.outcome, BackfillStart::NothingToDo);
}

TEST_F(TrackerFixture, FinishedWorkersAreJoinedOnNextStart) {
  auto waitUntilFinished = [this](const std::string &id) {
    for (int i = 0; i < 500; ++i) {
      auto state = jobs->archiveJob(id);
      if (state && state->status != JobStatus::Running)
        return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  };

  for (int round = 0; round < 5; ++round) {
    const std::string id = jobs->startUserArchive(kInstance, "alice", 2);
    EXPECT_EQ(jobs->workerCount(), 1u);
    ASSERT_TRUE(waitUntilFinished(id));
  }

  ASSERT_TRUE(store.upsertPost(kInstance, parseRemoteNote(makeNote("shot"))));
  auto start = jobs->startScreenshotBackfill();
  EXPECT_EQ(start.outcome, BackfillStart::Started);
  EXPECT_EQ(jobs->workerCount(), 1u);

  jobs->waitForIdle();
  EXPECT_EQ(jobs->workerCount(), 0u);
}
