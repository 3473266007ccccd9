#include <gtest/gtest.h>

#include "LocalServer.hpp"
#include "NoteParser.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <httplib.h>

using namespace archiver;
using namespace archiver::test;
using json = nlohmann::json;

namespace {

constexpr int kFirstPort = 47570;

bool endsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Remote side is faked; the loopback side uses the real httplib client.
struct ServerFixture : ::testing::Test {
  TempDir dir;
  FakeTransport remote{[](const RecordedCall &call) {
    if (endsWith(call.url, "/api/notes/show")) {
      json body = json::parse(call.body);
      return jsonResponse(makeNote(body["noteId"].get<std::string>()));
    }
    if (endsWith(call.url, "/api/users/show"))
      return jsonResponse(json{{"id", "u1"}});
    if (endsWith(call.url, "/api/users/notes"))
      return jsonResponse(json::array({makeNote("p1")}));
    return HttpResponse{404, "", "text/plain"};
  }};
  RecordingSleeper sleeper;
  RemoteClient client{remote, RetryPolicy{}, sleeper.sleeper()};
  MediaFetcher fetcher{remote, dir.str("media")};
  PostStore store{dir.str("archive.db"), fetcher};
  RenderRegistry registry;
  FakeRenderer renderer;
  std::unique_ptr<LocalServer> server;
  std::unique_ptr<RenderSnapshotService> snapshots;
  std::unique_ptr<ArchivePipeline> pipeline;
  std::unique_ptr<JobTracker> jobs;
  HttplibTransport http;

  void SetUp() override {
    store.initializeSchema();
    std::filesystem::create_directories(dir.path() / "media");
    server = std::make_unique<LocalServer>(registry, dir.str("media"));
    ASSERT_TRUE(server->bindFreePort(kFirstPort).has_value());
    snapshots = std::make_unique<RenderSnapshotService>(store, registry,
                                                        &renderer,
                                                        server->baseUrl());
    pipeline = std::make_unique<ArchivePipeline>(client, store, snapshots.get(),
                                                 sleeper.sleeper());
    jobs = std::make_unique<JobTracker>(*pipeline, *snapshots, store);
    server->mountApi(ApiContext{store, *pipeline, *jobs, *snapshots, 500, ""});
    ASSERT_TRUE(server->start());
  }

  void TearDown() override {
    server->stop();
    jobs.reset();
  }

  HttpResponse get(const std::string &path) {
    return http.get(server->baseUrl() + path, std::chrono::seconds(5));
  }

  HttpResponse post(const std::string &path, const json &body) {
    return http.post(server->baseUrl() + path, body.dump(), "application/json",
                     std::chrono::seconds(5));
  }
};

} // namespace

TEST_F(ServerFixture, RenderPagesExistOnlyWhileRegistered) {
  std::string token;
  {
    RenderRegistry::Registration page(registry, "abc123", "<p>mirror</p>");
    token = page.token();
    auto res = get("/render/" + token);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "<p>mirror</p>");
  }
  EXPECT_EQ(get("/render/" + token).status, 404);
}

TEST_F(ServerFixture, MediaFilesAreServed) {
  std::filesystem::create_directories(dir.path() / "media" / "bucket");
  {
    std::ofstream out(dir.path() / "media" / "bucket" / "a.png", std::ios::binary);
    out << "PNG";
  }
  auto res = get("/media/bucket/a.png");
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, "PNG");
}

TEST_F(ServerFixture, ArchiveSinglePostThenBrowseIt) {
  auto res = post("/api/archive", json{{"input", "https://ex.social/notes/abc"}});
  ASSERT_EQ(res.status, 200) << res.body;
  json body = json::parse(res.body);
  EXPECT_EQ(body["status"], "archived");
  EXPECT_EQ(body["post_id"], "ex.social/abc");
  EXPECT_EQ(body["url"], "https://ex.social/notes/abc");

  // The snapshot was captured through this server's render route
  ASSERT_EQ(renderer.requests().size(), 1u);
  EXPECT_EQ(renderer.requests()[0].url.rfind(server->baseUrl() + "/render/", 0),
            0u);

  auto again = json::parse(
      post("/api/archive", json{{"input", "https://ex.social/notes/abc"}}).body);
  EXPECT_EQ(again["status"], "already_archived");

  auto posts = json::parse(get("/api/posts").body);
  ASSERT_TRUE(posts.is_array());
  ASSERT_EQ(posts.size(), 1u);
  EXPECT_EQ(posts[0]["media_count"], 0);
  EXPECT_FALSE(posts[0].contains("raw_json"));

  auto page = get("/post/ex.social/abc");
  EXPECT_EQ(page.status, 200);
  EXPECT_NE(page.body.find("class=\"card\""), std::string::npos);
  EXPECT_EQ(get("/post/ex.social/missing").status, 404);

  auto shot = get("/screenshot/ex.social/abc");
  EXPECT_EQ(shot.status, 200);
  EXPECT_EQ(shot.contentType, "image/png");

  auto listing = get("/");
  EXPECT_NE(listing.body.find("Archived posts (1)"), std::string::npos);
}

TEST_F(ServerFixture, InputErrorsAreBadRequests) {
  auto missingInstance = post("/api/archive", json{{"input", "carol"}});
  EXPECT_EQ(missingInstance.status, 400);
  EXPECT_TRUE(json::parse(missingInstance.body).contains("error"));

  EXPECT_EQ(post("/api/archive", json{{"input", "??"}}).status, 400);
  EXPECT_EQ(post("/api/archive", json{{"input", "carol"},
                                      {"instance", "ex.social"},
                                      {"max_posts", "lots"}})
                .status,
            400);
}

TEST_F(ServerFixture, MalformedArchiveRequestsAreBadRequests) {
  auto nonString = post("/api/archive", json{{"input", 42}});
  EXPECT_EQ(nonString.status, 400);
  EXPECT_TRUE(json::parse(nonString.body).contains("error"));

  EXPECT_EQ(post("/api/archive", json{{"input", "@bob@ex.social"},
                                      {"max_posts", 4294967301LL}})
                .status,
            400);
  EXPECT_EQ(post("/api/archive", json{{"input", "@bob@ex.social"},
                                      {"max_posts", "12abc"}})
                .status,
            400);
  EXPECT_EQ(post("/api/archive", json{{"input", "@bob@ex.social"},
                                      {"max_posts", 2.5}})
                .status,
            400);
  EXPECT_TRUE(remote.calls().empty());
}

TEST_F(ServerFixture, DownloadServesZipArchive) {
  ASSERT_EQ(post("/api/archive", json{{"input", "https://ex.social/notes/zip1"}})
                .status,
            200);

  auto res = get("/download/ex.social/zip1");
  ASSERT_EQ(res.status, 200);
  EXPECT_EQ(res.contentType, "application/zip");
  ASSERT_GE(res.body.size(), 4u);
  EXPECT_EQ(res.body.substr(0, 4), std::string("PK\x03\x04", 4));

  httplib::Client client(server->baseUrl());
  auto raw = client.Get("/download/ex.social/zip1");
  ASSERT_TRUE(raw);
  EXPECT_EQ(raw->get_header_value("Content-Disposition"),
            "attachment; filename=\"note_archive_ex_social_zip1.zip\"");

  EXPECT_EQ(get("/download/ex.social/none").status, 404);
}

TEST_F(ServerFixture, RemoteFailuresAreBadGateway) {
  remote.setHandler([](const RecordedCall &) {
    return HttpResponse{403, "nope", "text/plain"};
  });
  auto res = post("/api/archive", json{{"input", "https://ex.social/notes/x"}});
  EXPECT_EQ(res.status, 502);
  EXPECT_NE(json::parse(res.body)["error"].get<std::string>().find("403"),
            std::string::npos);
}

TEST_F(ServerFixture, UserArchiveRunsAsPolledJob) {
  auto res = post("/api/archive", json{{"input", "@alice@ex.social"},
                                       {"max_posts", 10}});
  ASSERT_EQ(res.status, 200) << res.body;
  json started = json::parse(res.body);
  EXPECT_EQ(started["status"], "started");
  EXPECT_EQ(started["user"], "alice");
  EXPECT_EQ(started["instance"], "https://ex.social");
  const std::string jobId = started["job_id"];

  jobs->waitForIdle();
  json progress = json::parse(get("/api/progress?job=" + jobId).body);
  EXPECT_EQ(progress["status"], "done");
  EXPECT_EQ(progress["result"]["archived"], 1);

  EXPECT_EQ(json::parse(get("/api/progress?job=zzz").body)["status"], "unknown");
}

TEST_F(ServerFixture, ScreenshotBackfillEndpoints) {
  json idle = json::parse(post("/api/retake-screenshots", json::object()).body);
  EXPECT_EQ(idle["status"], "nothing_to_do");

  ASSERT_TRUE(store.upsertPost("https://ex.social", parseRemoteNote(makeNote("q"))));
  json started = json::parse(post("/api/retake-screenshots", json::object()).body);
  EXPECT_EQ(started["status"], "started");
  EXPECT_EQ(started["total"], 1);

  jobs->waitForIdle();
  json state = json::parse(get("/api/screenshot-progress").body);
  EXPECT_EQ(state["status"], "done");
  EXPECT_EQ(state["done"], 1);

  EXPECT_EQ(json::parse(get("/api/renderer-status").body)["available"], true);
}
