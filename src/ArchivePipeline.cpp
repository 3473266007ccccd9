#include "ArchivePipeline.hpp"
#include "ArchiveErrors.hpp"
#include "NoteParser.hpp"
#include "UrlUtils.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace archiver {

namespace {

constexpr std::size_t kOverloadExcerpt = 120;

void sleepFor(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

RemoteError overloadError(const RemoteError &e) {
  const std::string original = std::string(e.what()).substr(0, kOverloadExcerpt);
  const std::string message =
      "The instance is under heavy load and timed out. Try again later or "
      "reduce max posts. (" + original + ")";
  if (e.status())
    return RemoteError(*e.status(), message);
  return RemoteError(message);
}

} // namespace

ArchivePipeline::ArchivePipeline(RemoteClient &client, PostStore &store,
                                 RenderSnapshotService *snapshots,
                                 Sleeper sleeper,
                                 std::chrono::milliseconds pageDelay)
    : m_client(client), m_store(store), m_snapshots(snapshots),
      m_sleep(sleeper ? std::move(sleeper) : Sleeper(sleepFor)),
      m_pageDelay(pageDelay) {}

bool ArchivePipeline::storeNote(const std::string &instance,
                                const RemoteNote &note) {
  auto postId = m_store.upsertPost(instance, note);
  if (!postId)
    return false;
  if (m_snapshots)
    m_snapshots->snapshotStoredPost(*postId);
  return true;
}

ArchiveOutcome ArchivePipeline::archiveSingle(const std::string &instance,
                                              const std::string &noteId) {
  std::cout << "[Pipeline] Archiving note " << noteId << " from " << instance
            << std::endl;
  const RemoteNote note = parseRemoteNote(m_client.fetchNote(instance, noteId));

  ArchiveOutcome outcome;
  outcome.postId =
      PostStore::makePostId(instance, note.id.empty() ? noteId : note.id);
  if (!storeNote(instance, note)) {
    outcome.status = ArchiveStatus::AlreadyArchived;
    std::cout << "[Pipeline] Already archived: " << outcome.postId << std::endl;
    return outcome;
  }
  outcome.status = ArchiveStatus::Archived;
  outcome.url = UrlUtils::stripTrailingSlashes(instance) + "/notes/" + note.id;
  std::cout << "[Pipeline] Archived " << outcome.postId << std::endl;
  return outcome;
}

UserArchiveResult ArchivePipeline::archiveUser(const std::string &instance,
                                               const std::string &username,
                                               int maxPosts,
                                               const ProgressCallback &progress) {
  if (maxPosts <= 0)
    throw InputError(InputErrorKind::InvalidArgument,
                     "max posts must be a positive number");

  const auto user = m_client.lookupUser(instance, username);
  const std::string userId = user["id"].get<std::string>();
  std::cout << "[Pipeline] Archiving up to " << maxPosts << " posts of @"
            << username << " (" << userId << ") from " << instance
            << std::endl;

  UserArchiveResult result;
  result.user = username;
  result.instance = instance;

  std::optional<std::string> untilId;
  for (;;) {
    const int requested =
        std::min<int64_t>(kPageSize, maxPosts - result.total);
    nlohmann::json page;
    try {
      page = m_client.fetchUserNotes(instance, userId, requested, untilId);
    } catch (const RemoteError &e) {
      if (e.isOverload())
        throw overloadError(e);
      throw;
    }
    if (page.empty())
      break;

    std::string lastId;
    for (const auto &raw : page) {
      const RemoteNote note = parseRemoteNote(raw);
      if (storeNote(instance, note))
        ++result.archived;
      else
        ++result.skipped;
      if (!note.id.empty())
        lastId = note.id;
    }
    result.total += static_cast<int64_t>(page.size());
    if (progress)
      progress(result.archived + result.skipped, result.total);
    std::cout << "[Pipeline] Page done: " << result.total << " fetched, "
              << result.archived << " new" << std::endl;

    if (static_cast<int>(page.size()) < requested ||
        result.total >= maxPosts || lastId.empty())
      break;
    untilId = lastId;
    m_sleep(m_pageDelay);
  }

  std::cout << "[Pipeline] @" << username << ": " << result.archived
            << " archived, " << result.skipped << " skipped" << std::endl;
  return result;
}

} // namespace archiver
