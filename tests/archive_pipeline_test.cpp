#include <gtest/gtest.h>

#include "ArchiveErrors.hpp"
#include "ArchivePipeline.hpp"
#include "test_support.hpp"

using namespace archiver;
using namespace archiver::test;
using json = nlohmann::json;

namespace {

const std::string kInstance = "https://ex.social";

bool endsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// A user timeline of `count` notes, newest first: n<count> ... n1.
class FakeInstance {
public:
  explicit FakeInstance(int count) : m_count(count) {}

  HttpResponse operator()(const RecordedCall &call) const {
    if (endsWith(call.url, "/api/users/show"))
      return jsonResponse(json{{"id", "u1"}, {"username", "alice"}});
    if (endsWith(call.url, "/api/notes/show")) {
      json body = json::parse(call.body);
      return jsonResponse(makeNote(body["noteId"].get<std::string>()));
    }
    if (endsWith(call.url, "/api/users/notes")) {
      json body = json::parse(call.body);
      int start = m_count; // newest id
      if (body.contains("untilId"))
        start = std::stoi(body["untilId"].get<std::string>().substr(1)) - 1;
      json page = json::array();
      for (int id = start; id >= 1 && static_cast<int>(page.size()) <
                                          body["limit"].get<int>();
           --id)
        page.push_back(makeNote("n" + std::to_string(id)));
      return jsonResponse(page);
    }
    return HttpResponse{404, "", "text/plain"};
  }

private:
  int m_count;
};

struct PipelineFixture : ::testing::Test {
  TempDir dir;
  FakeTransport transport;
  RecordingSleeper retrySleeper;
  RecordingSleeper pageSleeper;
  RemoteClient client{transport, RetryPolicy{}, retrySleeper.sleeper()};
  MediaFetcher fetcher{transport, dir.str("media")};
  PostStore store{dir.str("archive.db"), fetcher};

  void SetUp() override { store.initializeSchema(); }

  ArchivePipeline pipeline(RenderSnapshotService *snapshots = nullptr) {
    return ArchivePipeline(client, store, snapshots, pageSleeper.sleeper());
  }
};

} // namespace

TEST_F(PipelineFixture, PaginatesWithChainedCursors) {
  transport.setHandler(FakeInstance(45));
  std::vector<std::pair<int64_t, int64_t>> progress;

  auto result = pipeline().archiveUser(
      kInstance, "alice", 45,
      [&progress](int64_t done, int64_t total) {
        progress.emplace_back(done, total);
      });

  auto pages = transport.callsTo("/api/users/notes");
  ASSERT_EQ(pages.size(), 3u);
  EXPECT_FALSE(json::parse(pages[0].body).contains("untilId"));
  EXPECT_EQ(json::parse(pages[1].body)["untilId"], "n26");
  EXPECT_EQ(json::parse(pages[2].body)["untilId"], "n6");
  EXPECT_EQ(json::parse(pages[2].body)["limit"], 5);

  EXPECT_EQ(result.total, 45);
  EXPECT_EQ(result.archived, 45);
  EXPECT_EQ(result.skipped, 0);
  EXPECT_EQ(result.user, "alice");
  EXPECT_EQ(result.instance, kInstance);
  EXPECT_EQ(store.listPosts().size(), 45u);

  // One delay between consecutive pages, none after the last
  ASSERT_EQ(pageSleeper.delays->size(), 2u);
  EXPECT_EQ((*pageSleeper.delays)[0], std::chrono::milliseconds(1000));

  ASSERT_EQ(progress.size(), 3u);
  EXPECT_EQ(progress[0], std::make_pair(int64_t{20}, int64_t{20}));
  EXPECT_EQ(progress[2], std::make_pair(int64_t{45}, int64_t{45}));
}

TEST_F(PipelineFixture, ShortPageEndsTheRun) {
  transport.setHandler(FakeInstance(5));
  auto result = pipeline().archiveUser(kInstance, "alice", 45);
  EXPECT_EQ(transport.callsTo("/api/users/notes").size(), 1u);
  EXPECT_EQ(result.total, 5);
  EXPECT_TRUE(pageSleeper.delays->empty());
}

TEST_F(PipelineFixture, SecondRunSkipsEverything) {
  transport.setHandler(FakeInstance(12));
  pipeline().archiveUser(kInstance, "alice", 12);
  auto again = pipeline().archiveUser(kInstance, "alice", 12);
  EXPECT_EQ(again.archived, 0);
  EXPECT_EQ(again.skipped, 12);
  EXPECT_EQ(store.listPosts().size(), 12u);
}

TEST_F(PipelineFixture, NonPositiveMaxPostsIsRejected) {
  transport.setHandler(FakeInstance(1));
  try {
    pipeline().archiveUser(kInstance, "alice", 0);
    FAIL() << "expected InputError";
  } catch (const InputError &e) {
    EXPECT_EQ(e.kind(), InputErrorKind::InvalidArgument);
  }
  EXPECT_TRUE(transport.calls().empty());
}

TEST_F(PipelineFixture, OverloadIsReportedAsFriendlyMessage) {
  FakeInstance instance(30);
  transport.setHandler([instance](const RecordedCall &call) {
    if (endsWith(call.url, "/api/users/notes"))
      return HttpResponse{500, R"({"error":{"code":"INTERNAL_ERROR"}})",
                          "application/json"};
    return instance(call);
  });

  try {
    pipeline().archiveUser(kInstance, "alice", 30);
    FAIL() << "expected RemoteError";
  } catch (const RemoteError &e) {
    const std::string message = e.what();
    EXPECT_NE(message.find("heavy load"), std::string::npos);
    EXPECT_NE(message.find("API request failed"), std::string::npos);
    EXPECT_EQ(e.status().value_or(0), 500);
  }
}

TEST_F(PipelineFixture, FailureKeepsCommittedPages) {
  int pageCalls = 0;
  FakeInstance instance(45);
  transport.setHandler([instance, &pageCalls](const RecordedCall &call) {
    if (endsWith(call.url, "/api/users/notes") && ++pageCalls > 1)
      return HttpResponse{403, "blocked", "text/plain"};
    return instance(call);
  });

  EXPECT_THROW(pipeline().archiveUser(kInstance, "alice", 45), RemoteError);
  EXPECT_EQ(store.listPosts().size(), 20u);
}

TEST_F(PipelineFixture, SingleNoteArchivedThenAlreadyArchived) {
  transport.setHandler(FakeInstance(1));

  auto first = pipeline().archiveSingle(kInstance, "abc");
  EXPECT_EQ(first.status, ArchiveStatus::Archived);
  EXPECT_EQ(first.postId, "ex.social/abc");
  EXPECT_EQ(first.url.value_or(""), "https://ex.social/notes/abc");

  auto second = pipeline().archiveSingle(kInstance, "abc");
  EXPECT_EQ(second.status, ArchiveStatus::AlreadyArchived);
  EXPECT_EQ(second.postId, "ex.social/abc");
  EXPECT_FALSE(second.url.has_value());
}

TEST_F(PipelineFixture, NewNotesGetSnapshots) {
  transport.setHandler(FakeInstance(3));
  RenderRegistry registry;
  FakeRenderer renderer;
  RenderSnapshotService snapshots(store, registry, &renderer,
                                  "http://127.0.0.1:5757");

  pipeline(&snapshots).archiveUser(kInstance, "alice", 10);
  EXPECT_EQ(renderer.requests().size(), 3u);
  EXPECT_EQ(store.countMissingSnapshots(), 0);

  pipeline(&snapshots).archiveUser(kInstance, "alice", 10);
  EXPECT_EQ(renderer.requests().size(), 3u);
}

TEST_F(PipelineFixture, SnapshotFailureDoesNotFailTheArchive) {
  transport.setHandler(FakeInstance(1));
  RenderRegistry registry;
  FakeRenderer renderer;
  renderer.succeed = false;
  RenderSnapshotService snapshots(store, registry, &renderer,
                                  "http://127.0.0.1:5757");

  auto outcome = pipeline(&snapshots).archiveSingle(kInstance, "n1");
  EXPECT_EQ(outcome.status, ArchiveStatus::Archived);
  EXPECT_FALSE(store.getPost("ex.social/n1")->screenshotPath.has_value());
}
