#pragma once

#include "PostStore.hpp"
#include "RenderRegistry.hpp"
#include "SnapshotRenderer.hpp"
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace archiver {

// Running tally after each post.
using BackfillProgress = std::function<void(const BackfillResult &)>;

/**
 * RenderSnapshotService produces snapshot images of archived posts. The
 * mirror HTML is published on the loopback server under a one-off token and
 * the renderer visits it. Every failure is logged and reported as an empty
 * optional; nothing here throws to the archiving path.
 */
class RenderSnapshotService {
public:
  // `renderer` may be null: snapshots are then reported unavailable.
  // `loopbackBase` is "http://127.0.0.1:<port>".
  RenderSnapshotService(PostStore &store, RenderRegistry &registry,
                        SnapshotRenderer *renderer, std::string loopbackBase);

  bool available() const;

  std::optional<std::string> snapshot(const std::string &postId,
                                      const std::string &html);

  // Mirror from the store, snapshot, record the path.
  std::optional<std::string> snapshotStoredPost(const std::string &postId);

  // Every post without a snapshot, oldest first.
  BackfillResult retakeBackfill(const BackfillProgress &progress = {});

  std::string snapshotPathFor(const std::string &postId) const;

private:
  PostStore &m_store;
  RenderRegistry &m_registry;
  SnapshotRenderer *m_renderer;
  std::string m_loopbackBase;
};

} // namespace archiver
