#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace archiver {

/**
 * HtmlMirror renders already-archived data as standalone HTML: the post
 * card used for pages and snapshots, and the listing page. Served pages
 * reference local media through the /media/ route so the same document
 * works in a browser and in the snapshot renderer; exported pages use
 * paths relative to the bundle.
 */
class HtmlMirror {
public:
  // Served: local copies as "/media/<relative path>".
  // Bundled: local copies as "media/<file name>", next to an exported page.
  enum class MediaLinks { Served, Bundled };

  static std::string renderPost(const PostRecord &post,
                                const std::vector<MediaRecord> &media,
                                const std::string &mediaRoot,
                                MediaLinks links = MediaLinks::Served);

  static std::string renderListing(const std::vector<PostSummary> &posts);

  static std::string escape(const std::string &text);

  // "/media/<relative path>" when localPath lives under mediaRoot.
  static std::string mediaUrl(const MediaRecord &media,
                              const std::string &mediaRoot);
  // "media/<file name>" for a local copy, else the origin URL.
  static std::string bundledMediaUrl(const MediaRecord &media);
};

} // namespace archiver
