#include "AppConfig.hpp"
#include "ArchiveErrors.hpp"
#include "ArchivePipeline.hpp"
#include "HttpTransport.hpp"
#include "InputResolver.hpp"
#include "JobTracker.hpp"
#include "JsonCodec.hpp"
#include "LocalServer.hpp"
#include "MediaFetcher.hpp"
#include "PostExporter.hpp"
#include "PostStore.hpp"
#include "RemoteClient.hpp"
#include "RenderRegistry.hpp"
#include "RenderSnapshotService.hpp"
#include "SnapshotRenderer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

std::atomic<bool> running{true};
std::mutex cv_m;
std::condition_variable cv;

static void signalHandler(int sig) {
  std::cout << "[Main] Shutdown signal received (" << sig << ")" << std::endl;
  running.store(false);
  cv.notify_all();
}

namespace fs = std::filesystem;
using json = nlohmann::json;

static int runArchive(const archiver::CommandLine &cmd,
                      archiver::ArchivePipeline &pipeline) {
  const auto target = archiver::InputResolver::resolve(cmd.args[0]);
  const std::string instance = archiver::InputResolver::resolveInstance(
      target, cmd.config.defaultInstance);

  if (auto *note = std::get_if<archiver::NoteTarget>(&target)) {
    std::cout << json(pipeline.archiveSingle(instance, note->noteId)).dump(2)
              << std::endl;
    return 0;
  }
  const auto &user = std::get<archiver::UserTarget>(target);
  auto result = pipeline.archiveUser(
      instance, user.username, cmd.config.maxPosts,
      [](int64_t done, int64_t total) {
        std::cout << "[Main] Progress: " << done << "/" << total << std::endl;
      });
  std::cout << json(result).dump(2) << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  archiver::CommandLine cmd;
  try {
    cmd = archiver::ConfigLoader::parse(argc, argv);
  } catch (const archiver::InputError &e) {
    std::cerr << "[Main] " << e.what() << "\n\n"
              << archiver::ConfigLoader::usage();
    return 2;
  }
  if (cmd.showHelp) {
    std::cout << archiver::ConfigLoader::usage();
    return 0;
  }
  const archiver::AppConfig &config = cmd.config;

  try {
    // 0. Ensure the archive layout exists
    fs::create_directories(config.dataDir);
    fs::create_directories(config.mediaPath());
    fs::path dbParent = fs::path(config.databasePath()).parent_path();
    if (!dbParent.empty())
      fs::create_directories(dbParent);

    // 1. Storage
    archiver::HttplibTransport transport;
    archiver::MediaFetcher fetcher(
        transport, config.mediaPath(),
        std::chrono::seconds(config.remoteTimeoutSeconds));
    archiver::PostStore store(config.databasePath(), fetcher);
    store.initializeSchema();
    std::cout << "[Main] Database ready at " << config.databasePath()
              << std::endl;

    if (cmd.command == "list") {
      std::cout << json(store.listPosts()).dump(2) << std::endl;
      return 0;
    }
    if (cmd.command == "export") {
      archiver::PostExporter exporter(store);
      auto bundle = exporter.buildBundle(cmd.args[0]);
      if (!bundle) {
        std::cerr << "[Main] Unknown post " << cmd.args[0] << std::endl;
        return 1;
      }
      return archiver::PostExporter::writeBundle(*bundle, cmd.args[1]) ? 0 : 1;
    }

    // 2. Loopback server first: the renderer needs its address
    archiver::RenderRegistry registry;
    archiver::LocalServer server(registry, config.mediaPath(), config.host);
    if (!server.bindFreePort(config.port)) {
      std::cerr << "[Main] Could not bind a local port." << std::endl;
      return 1;
    }

    // 3. Services
    archiver::HeadlessChromeRenderer renderer(config.browser);
    archiver::RenderSnapshotService snapshots(store, registry, &renderer,
                                              server.baseUrl());
    archiver::RetryPolicy policy;
    policy.maxAttempts = config.remoteAttempts;
    policy.timeout = std::chrono::seconds(config.remoteTimeoutSeconds);
    archiver::RemoteClient client(transport, policy);
    archiver::ArchivePipeline pipeline(
        client, store, &snapshots, {},
        std::chrono::milliseconds(config.pageDelayMs));
    archiver::JobTracker jobs(pipeline, snapshots, store);

    server.mountApi(archiver::ApiContext{store, pipeline, jobs, snapshots,
                                         config.maxPosts,
                                         config.defaultInstance});
    if (!server.start())
      return 1;

    int status = 0;
    if (cmd.command == "archive") {
      status = runArchive(cmd, pipeline);
    } else if (cmd.command == "retake") {
      auto result = snapshots.retakeBackfill(
          [](const archiver::BackfillResult &tally) {
            std::cout << "[Main] Snapshots: " << tally.done + tally.failed
                      << "/" << tally.total << std::endl;
          });
      std::cout << json(result).dump(2) << std::endl;
    } else {
      std::signal(SIGINT, signalHandler);
      std::signal(SIGTERM, signalHandler);
      std::cout << "[Main] Archive UI at " << server.baseUrl()
                << ". Press Ctrl+C to exit gracefully." << std::endl;
      std::unique_lock<std::mutex> lock(cv_m);
      cv.wait(lock, [] { return !running.load(); });
    }

    server.stop();
    jobs.waitForIdle();
    std::cout << "[Main] Finished." << std::endl;
    return status;

  } catch (const archiver::InputError &e) {
    std::cerr << "[Main] " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
}
