#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace archiver {

/**
 * Client side of Chrome's --remote-debugging-pipe transport: JSON messages
 * terminated by a NUL byte, exchanged over one socket. Commands are matched
 * to their replies by id; events that arrive in between are queued for
 * waitForEvent(). Protocol and I/O failures raise RenderError.
 */
class DevToolsPipe {
public:
  using Clock = std::chrono::steady_clock;
  using EventFilter = std::function<bool(const nlohmann::json &params)>;

  // Takes ownership of the socket.
  explicit DevToolsPipe(int fd);
  ~DevToolsPipe();

  DevToolsPipe(const DevToolsPipe &) = delete;
  DevToolsPipe &operator=(const DevToolsPipe &) = delete;

  // Sends a command and returns its "result" object.
  nlohmann::json call(const std::string &method, const nlohmann::json &params,
                      Clock::time_point deadline,
                      const std::string &sessionId = "");

  // Sends a command without waiting for the reply.
  void notify(const std::string &method, const nlohmann::json &params,
              const std::string &sessionId = "");

  // False when the deadline passes first.
  bool waitForEvent(const std::string &method, const std::string &sessionId,
                    Clock::time_point deadline, const EventFilter &filter = {});

  void discardEvents() { m_events.clear(); }

private:
  int send(const std::string &method, const nlohmann::json &params,
           const std::string &sessionId);
  std::optional<nlohmann::json> readMessage(Clock::time_point deadline);
  bool matches(const nlohmann::json &event, const std::string &method,
               const std::string &sessionId, const EventFilter &filter) const;

  int m_fd;
  int m_nextId = 1;
  std::string m_buffer;
  std::deque<nlohmann::json> m_events;
};

// Standard base64 (as in Page.captureScreenshot data); nullopt if malformed.
std::optional<std::string> decodeBase64(const std::string &encoded);

} // namespace archiver
