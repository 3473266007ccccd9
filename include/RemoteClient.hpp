#pragma once

#include "HttpTransport.hpp"
#include "types.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace archiver {

struct RetryPolicy {
  int maxAttempts = 3;
  std::chrono::milliseconds baseDelay{2000}; // attempt k waits baseDelay*(k-1)
  std::chrono::seconds timeout{30};          // per attempt
};

/**
 * RemoteClient talks to the Misskey/Sharkey style API of one instance.
 * All calls are unauthenticated JSON POSTs to <instance>/api/<endpoint>.
 * Busy instances answer 500 under load, so transport errors and 500s are
 * retried a bounded number of times; every other failure is immediate.
 */
class RemoteClient {
public:
  static constexpr int kMaxPageSize = 20;

  RemoteClient(HttpTransport &transport, RetryPolicy policy = {},
               Sleeper sleeper = {});

  // Throws RemoteError.
  nlohmann::json call(const std::string &instance, const std::string &endpoint,
                      const nlohmann::json &payload);

  nlohmann::json lookupUser(const std::string &instance,
                            const std::string &username);
  nlohmann::json fetchNote(const std::string &instance,
                           const std::string &noteId);
  // Newest first, originals only. `limit` is clamped to [1, kMaxPageSize].
  nlohmann::json fetchUserNotes(const std::string &instance,
                                const std::string &userId, int limit,
                                const std::optional<std::string> &untilId);

private:
  HttpTransport &m_transport;
  RetryPolicy m_policy;
  Sleeper m_sleep;
};

} // namespace archiver
