#include "RenderSnapshotService.hpp"
#include "HtmlMirror.hpp"
#include "MediaFetcher.hpp"
#include "UuidUtils.hpp"
#include <exception>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace archiver {

RenderSnapshotService::RenderSnapshotService(PostStore &store,
                                             RenderRegistry &registry,
                                             SnapshotRenderer *renderer,
                                             std::string loopbackBase)
    : m_store(store), m_registry(registry), m_renderer(renderer),
      m_loopbackBase(std::move(loopbackBase)) {}

bool RenderSnapshotService::available() const {
  return m_renderer != nullptr && m_renderer->available();
}

std::string
RenderSnapshotService::snapshotPathFor(const std::string &postId) const {
  return (fs::path(m_store.mediaRoot()) / MediaFetcher::sanitizeBucket(postId) /
          "screenshot.png")
      .string();
}

std::optional<std::string>
RenderSnapshotService::snapshot(const std::string &postId,
                                const std::string &html) {
  if (!available()) {
    std::cerr << "[Render] Renderer unavailable, skipping snapshot of "
              << postId << std::endl;
    return std::nullopt;
  }

  const std::string dest = snapshotPathFor(postId);
  std::error_code ec;
  fs::create_directories(fs::path(dest).parent_path(), ec);
  if (ec) {
    std::cerr << "[Render] Cannot create " << fs::path(dest).parent_path()
              << ": " << ec.message() << std::endl;
    return std::nullopt;
  }

  RenderRegistry::Registration page(m_registry,
                                    UuidUtils::shortToken(postId, 16), html);
  CaptureRequest request;
  request.url = m_loopbackBase + "/render/" + page.token();
  request.destPath = dest;

  bool ok = false;
  try {
    ok = m_renderer->capture(request);
  } catch (const std::exception &e) {
    std::cerr << "[Render] Snapshot error for " << postId << ": " << e.what()
              << std::endl;
    ok = false;
  }
  if (!ok) {
    std::cerr << "[Render] Snapshot failed for " << postId << std::endl;
    return std::nullopt;
  }
  std::cout << "[Render] Snapshot saved: " << dest << std::endl;
  return dest;
}

std::optional<std::string>
RenderSnapshotService::snapshotStoredPost(const std::string &postId) {
  auto post = m_store.getPost(postId);
  if (!post) {
    std::cerr << "[Render] Unknown post " << postId << std::endl;
    return std::nullopt;
  }
  const std::string html =
      HtmlMirror::renderPost(*post, m_store.listMedia(postId), m_store.mediaRoot());
  auto path = snapshot(postId, html);
  if (path && !m_store.updateSnapshotPath(postId, *path))
    return std::nullopt;
  return path;
}

BackfillResult
RenderSnapshotService::retakeBackfill(const BackfillProgress &progress) {
  const auto ids = m_store.listMissingSnapshots();
  BackfillResult result;
  result.total = static_cast<int64_t>(ids.size());
  std::cout << "[Render] Backfill of " << result.total << " snapshot(s)"
            << std::endl;
  for (const auto &id : ids) {
    if (snapshotStoredPost(id))
      ++result.done;
    else
      ++result.failed;
    if (progress)
      progress(result);
  }
  std::cout << "[Render] Backfill finished: " << result.done << " done, "
            << result.failed << " failed" << std::endl;
  return result;
}

} // namespace archiver
