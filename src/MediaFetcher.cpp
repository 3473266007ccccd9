#include "MediaFetcher.hpp"
#include "ArchiveErrors.hpp"
#include "UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace archiver {

namespace {

const std::map<std::string, std::string> &extensionTable() {
  static const std::map<std::string, std::string> table{
      {"image/jpeg", ".jpeg"},      {"image/pjpeg", ".jpe"},
      {"image/png", ".png"},        {"image/apng", ".apng"},
      {"image/gif", ".gif"},        {"image/webp", ".webp"},
      {"image/avif", ".avif"},      {"image/bmp", ".bmp"},
      {"image/svg+xml", ".svg"},    {"image/x-icon", ".ico"},
      {"image/tiff", ".tiff"},      {"video/mp4", ".mp4"},
      {"video/webm", ".webm"},      {"video/quicktime", ".mov"},
      {"video/ogg", ".ogv"},        {"video/x-matroska", ".mkv"},
      {"audio/mpeg", ".mp3"},       {"audio/ogg", ".ogg"},
      {"audio/opus", ".opus"},      {"audio/wav", ".wav"},
      {"audio/x-wav", ".wav"},      {"audio/webm", ".weba"},
      {"audio/aac", ".aac"},        {"audio/flac", ".flac"},
      {"audio/mp4", ".m4a"},        {"text/plain", ".txt"},
      {"application/pdf", ".pdf"},  {"application/zip", ".zip"},
      {"application/octet-stream", ".bin"},
  };
  return table;
}

std::string normalizeExtension(const std::string &ext) {
  if (ext == ".jpe" || ext == ".jpeg")
    return ".jpg";
  return ext;
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

MediaFetcher::MediaFetcher(HttpTransport &transport, std::string mediaRoot,
                           std::chrono::seconds timeout)
    : m_transport(transport), m_mediaRoot(std::move(mediaRoot)),
      m_timeout(timeout) {}

std::string MediaFetcher::sanitizeBucket(const std::string &postId) {
  std::string bucket = postId;
  for (char &c : bucket) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-')
      c = '_';
  }
  return bucket;
}

std::string MediaFetcher::extensionForContentType(const std::string &contentType) {
  std::string type = contentType.substr(0, contentType.find(';'));
  type = lower(UrlUtils::trim(type));
  auto it = extensionTable().find(type);
  if (it == extensionTable().end())
    return ".bin";
  return normalizeExtension(it->second);
}

std::optional<std::string> MediaFetcher::fetch(const std::string &url,
                                               const std::string &bucket,
                                               const std::string &assetId) {
  try {
    HttpResponse res = m_transport.get(url, m_timeout);
    if (res.status < 200 || res.status >= 300) {
      std::cerr << "[Media] Download failed with status " << res.status
                << ": " << url << std::endl;
      return std::nullopt;
    }

    std::string contentType =
        res.contentType.empty() ? "application/octet-stream" : res.contentType;
    fs::path dest = fs::path(m_mediaRoot) / bucket /
                    (assetId + extensionForContentType(contentType));
    fs::create_directories(dest.parent_path());

    std::ofstream ofs(dest, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      std::cerr << "[Media] Unable to write " << dest << std::endl;
      return std::nullopt;
    }
    ofs.write(res.body.data(), static_cast<std::streamsize>(res.body.size()));
    if (!ofs) {
      std::cerr << "[Media] Short write for " << dest << std::endl;
      return std::nullopt;
    }
    return dest.string();
  } catch (const TransportError &e) {
    std::cerr << "[Media] media fail: " << url << " - " << e.what() << std::endl;
  } catch (const fs::filesystem_error &e) {
    std::cerr << "[Media] media fail: " << url << " - " << e.what() << std::endl;
  }
  return std::nullopt;
}

} // namespace archiver
