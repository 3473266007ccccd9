#pragma once

#include "HttpTransport.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace archiver {

/**
 * MediaFetcher downloads post attachments into per-post buckets under the
 * media root. Failures are logged and reported as an empty optional: a post
 * whose media could not be fetched is still archived.
 */
class MediaFetcher {
public:
  MediaFetcher(HttpTransport &transport, std::string mediaRoot,
               std::chrono::seconds timeout = std::chrono::seconds(30));

  // Writes <mediaRoot>/<bucket>/<assetId><ext> and returns its path.
  std::optional<std::string> fetch(const std::string &url,
                                   const std::string &bucket,
                                   const std::string &assetId);

  const std::string &mediaRoot() const { return m_mediaRoot; }

  // Every character outside [A-Za-z0-9_-] becomes '_'.
  static std::string sanitizeBucket(const std::string &postId);

  // ".jpg", ".png", ... from a Content-Type header; ".bin" when unknown.
  static std::string extensionForContentType(const std::string &contentType);

private:
  HttpTransport &m_transport;
  std::string m_mediaRoot;
  std::chrono::seconds m_timeout;
};

} // namespace archiver
