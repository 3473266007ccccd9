#include "RemoteClient.hpp"
#include "ArchiveErrors.hpp"
#include "UrlUtils.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace archiver {

namespace {

constexpr std::size_t kBodyExcerpt = 300;

void sleepFor(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

} // namespace

RemoteClient::RemoteClient(HttpTransport &transport, RetryPolicy policy,
                           Sleeper sleeper)
    : m_transport(transport), m_policy(policy),
      m_sleep(sleeper ? std::move(sleeper) : Sleeper(sleepFor)) {}

json RemoteClient::call(const std::string &instance, const std::string &endpoint,
                        const json &payload) {
  const std::string url =
      UrlUtils::stripTrailingSlashes(instance) + "/api/" + endpoint;
  const std::string body = payload.dump();
  const int attempts = std::max(1, m_policy.maxAttempts);

  std::string lastError;
  std::optional<int> lastStatus;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (attempt > 1)
      m_sleep(m_policy.baseDelay * (attempt - 1));

    HttpResponse res;
    try {
      res = m_transport.post(url, body, "application/json", m_policy.timeout);
    } catch (const TransportError &e) {
      lastError = e.what();
      lastStatus.reset();
      std::cerr << "[Remote] Request error (" << lastError << "), attempt "
                << attempt << "/" << attempts << std::endl;
      continue;
    }

    if (res.status >= 200 && res.status < 300) {
      try {
        return json::parse(res.body);
      } catch (const json::parse_error &e) {
        throw RemoteError(res.status, "Malformed JSON from " + instance + "/api/" +
                                          endpoint + ": " + e.what());
      }
    }

    if (res.status == 500) {
      // Server overloaded or statement timeout: worth another try
      lastError = "API 500 from " + instance + ": " +
                  res.body.substr(0, kBodyExcerpt);
      lastStatus = 500;
      std::cerr << "[Remote] API 500 (attempt " << attempt << "/" << attempts
                << ") for " << endpoint << std::endl;
      continue;
    }

    throw RemoteError(res.status, "API error " + std::to_string(res.status) +
                                      " from " + instance + ": " +
                                      res.body.substr(0, kBodyExcerpt));
  }

  std::string message = "API request failed after " + std::to_string(attempts) +
                        " attempts: " + lastError;
  if (lastStatus)
    throw RemoteError(*lastStatus, message);
  throw RemoteError(message);
}

json RemoteClient::lookupUser(const std::string &instance,
                              const std::string &username) {
  json user = call(instance, "users/show", {{"username", username}});
  if (!user.is_object() || !user.contains("id") || !user["id"].is_string())
    throw RemoteError("User lookup for " + username + " on " + instance +
                      " returned no user id");
  return user;
}

json RemoteClient::fetchNote(const std::string &instance,
                             const std::string &noteId) {
  json note = call(instance, "notes/show", {{"noteId", noteId}});
  if (!note.is_object())
    throw RemoteError("Unexpected notes/show response from " + instance);
  return note;
}

json RemoteClient::fetchUserNotes(const std::string &instance,
                                  const std::string &userId, int limit,
                                  const std::optional<std::string> &untilId) {
  // Small batches keep busy instances clear of statement timeouts
  json payload;
  payload["userId"] = userId;
  payload["limit"] = std::clamp(limit, 1, kMaxPageSize);
  payload["includeReplies"] = false;
  payload["withRenotes"] = false;
  if (untilId && !untilId->empty())
    payload["untilId"] = *untilId;

  json notes = call(instance, "users/notes", payload);
  if (!notes.is_array())
    throw RemoteError("Unexpected users/notes response from " + instance);
  return notes;
}

} // namespace archiver
