#pragma once

#include "ArchivePipeline.hpp"
#include "JobTracker.hpp"
#include "PostStore.hpp"
#include "RenderRegistry.hpp"
#include "RenderSnapshotService.hpp"
#include <memory>
#include <optional>
#include <string>

namespace archiver {

struct ApiContext {
  PostStore &store;
  ArchivePipeline &pipeline;
  JobTracker &jobs;
  RenderSnapshotService &snapshots;
  int defaultMaxPosts = 500;
  std::string defaultInstance;
};

/**
 * LocalServer is the loopback HTTP boundary. It is created before the
 * services because the snapshot renderer needs its address: bind first,
 * mount the API once the services exist, then start serving.
 *
 * Render pages (/render/<token>) and media files (/media/...) are
 * available as soon as the server is constructed.
 */
class LocalServer {
public:
  LocalServer(RenderRegistry &registry, const std::string &mediaRoot,
              std::string host = "127.0.0.1");
  ~LocalServer();

  // Binds the first free port in [preferred, preferred + span). Returns the
  // bound port, or nullopt when none is free.
  std::optional<int> bindFreePort(int preferred, int span = 20);

  void mountApi(const ApiContext &context);

  // Serves on a background thread until stop().
  bool start();
  void stop();

  int port() const { return m_port; }
  std::string baseUrl() const;

private:
  std::string m_host;
  int m_port = 0;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace archiver
