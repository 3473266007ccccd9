#pragma once

#include "PostStore.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace archiver {

/**
 * PostExporter packs one archived post into a self-contained bundle:
 * post.json, post.html, media/<file> and screenshot.png when present.
 */
class PostExporter {
public:
  explicit PostExporter(PostStore &store);

  // nullopt for an unknown post.
  std::optional<std::vector<BundleEntry>> buildBundle(const std::string &postId);

  // Writes each entry below `directory`; returns false on the first failure.
  static bool writeBundle(const std::vector<BundleEntry> &entries,
                          const std::string &directory);

  // Deflated ZIP archive of the entries, nullopt when it cannot be built.
  static std::optional<std::string>
  zipBundle(const std::vector<BundleEntry> &entries);

  // "note_archive_<post id with unsafe characters replaced>.zip"
  static std::string archiveFileName(const std::string &postId);

private:
  PostStore &m_store;
};

} // namespace archiver
