#include "PostExporter.hpp"
#include "HtmlMirror.hpp"
#include "JsonCodec.hpp"
#include "MediaFetcher.hpp"
#include "UuidUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <minizip/zip.h>
#include <nlohmann/json.hpp>
#include <utility>
#include <zlib.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace archiver {

namespace {

std::optional<std::string> readFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// Scratch file for minizip, removed when the archive has been read back.
class TempArchive {
public:
  TempArchive()
      : m_path(fs::temp_directory_path() /
               ("note_archive_" + UuidUtils::shortToken("export", 12) +
                ".zip")) {}
  ~TempArchive() {
    std::error_code ec;
    fs::remove(m_path, ec);
  }
  const fs::path &path() const { return m_path; }

private:
  fs::path m_path;
};

} // namespace

PostExporter::PostExporter(PostStore &store) : m_store(store) {}

std::optional<std::vector<BundleEntry>>
PostExporter::buildBundle(const std::string &postId) {
  auto post = m_store.getPost(postId);
  if (!post)
    return std::nullopt;
  const auto media = m_store.listMedia(postId);

  json record = *post;
  json raw = json::parse(post->rawJson, nullptr, false);
  if (!raw.is_discarded())
    record["raw_json"] = raw;

  std::vector<BundleEntry> entries;
  entries.push_back({"post.json", record.dump(2)});

  // Pages link to bundled copies; assets without one keep their origin URL.
  std::vector<BundleEntry> files;
  std::vector<MediaRecord> linked = media;
  for (auto &m : linked) {
    if (!m.localPath)
      continue;
    if (auto bytes = readFile(*m.localPath))
      files.push_back(
          {"media/" + fs::path(*m.localPath).filename().string(), *bytes});
    else
      m.localPath.reset();
  }
  entries.push_back({"post.html",
                     HtmlMirror::renderPost(*post, linked, m_store.mediaRoot(),
                                            HtmlMirror::MediaLinks::Bundled)});
  for (auto &file : files)
    entries.push_back(std::move(file));
  if (post->screenshotPath && !post->screenshotPath->empty()) {
    if (auto bytes = readFile(*post->screenshotPath))
      entries.push_back({"screenshot.png", *bytes});
  }
  return entries;
}

bool PostExporter::writeBundle(const std::vector<BundleEntry> &entries,
                               const std::string &directory) {
  for (const auto &entry : entries) {
    fs::path dest = fs::path(directory) / entry.name;
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
      std::cerr << "[Export] Cannot create " << dest.parent_path() << ": "
                << ec.message() << std::endl;
      return false;
    }
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    out.write(entry.bytes.data(),
              static_cast<std::streamsize>(entry.bytes.size()));
    if (!out) {
      std::cerr << "[Export] Failed to write " << dest << std::endl;
      return false;
    }
  }
  std::cout << "[Export] Wrote " << entries.size() << " file(s) to "
            << directory << std::endl;
  return true;
}

std::optional<std::string>
PostExporter::zipBundle(const std::vector<BundleEntry> &entries) {
  TempArchive archive;
  zipFile zf = zipOpen64(archive.path().string().c_str(), APPEND_STATUS_CREATE);
  if (!zf) {
    std::cerr << "[Export] Cannot create archive " << archive.path()
              << std::endl;
    return std::nullopt;
  }
  for (const auto &entry : entries) {
    zip_fileinfo info = {};
    bool ok = zipOpenNewFileInZip64(zf, entry.name.c_str(), &info, nullptr, 0,
                                    nullptr, 0, nullptr, Z_DEFLATED,
                                    Z_DEFAULT_COMPRESSION, 1) == ZIP_OK;
    if (ok && !entry.bytes.empty())
      ok = zipWriteInFileInZip(zf, entry.bytes.data(),
                               static_cast<unsigned int>(entry.bytes.size())) ==
           ZIP_OK;
    if (zipCloseFileInZip(zf) != ZIP_OK)
      ok = false;
    if (!ok) {
      std::cerr << "[Export] Failed to add " << entry.name << " to archive"
                << std::endl;
      zipClose(zf, nullptr);
      return std::nullopt;
    }
  }
  if (zipClose(zf, nullptr) != ZIP_OK) {
    std::cerr << "[Export] Failed to finish archive" << std::endl;
    return std::nullopt;
  }
  return readFile(archive.path().string());
}

std::string PostExporter::archiveFileName(const std::string &postId) {
  return "note_archive_" + MediaFetcher::sanitizeBucket(postId) + ".zip";
}

} // namespace archiver
