#include "DevToolsPipe.hpp"
#include "ArchiveErrors.hpp"
#include <cerrno>
#include <cstring>
#include <openssl/evp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

namespace archiver {

DevToolsPipe::DevToolsPipe(int fd) : m_fd(fd) {}

DevToolsPipe::~DevToolsPipe() {
  if (m_fd >= 0)
    ::close(m_fd);
}

int DevToolsPipe::send(const std::string &method, const json &params,
                       const std::string &sessionId) {
  const int id = m_nextId++;
  json message = {{"id", id}, {"method", method}, {"params", params}};
  if (!sessionId.empty())
    message["sessionId"] = sessionId;
  std::string frame = message.dump();
  frame.push_back('\0');

  std::size_t offset = 0;
  while (offset < frame.size()) {
    ssize_t n = ::send(m_fd, frame.data() + offset, frame.size() - offset,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw RenderError("Writing " + method + " failed: " + std::strerror(errno));
    }
    offset += static_cast<std::size_t>(n);
  }
  return id;
}

std::optional<json> DevToolsPipe::readMessage(Clock::time_point deadline) {
  for (;;) {
    auto end = m_buffer.find('\0');
    if (end != std::string::npos) {
      std::string frame = m_buffer.substr(0, end);
      m_buffer.erase(0, end + 1);
      json message = json::parse(frame, nullptr, false);
      if (message.is_discarded() || !message.is_object())
        throw RenderError("Browser sent an unreadable message");
      return message;
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (left.count() <= 0)
      return std::nullopt;
    struct pollfd pfd = {m_fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      throw RenderError(std::string("poll failed: ") + std::strerror(errno));
    }
    if (ready == 0)
      return std::nullopt;

    char chunk[16384];
    ssize_t n = ::read(m_fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      throw RenderError(std::string("read failed: ") + std::strerror(errno));
    }
    if (n == 0)
      throw RenderError("Browser closed the debugging pipe");
    m_buffer.append(chunk, static_cast<std::size_t>(n));
  }
}

json DevToolsPipe::call(const std::string &method, const json &params,
                        Clock::time_point deadline,
                        const std::string &sessionId) {
  const int id = send(method, params, sessionId);
  for (;;) {
    auto message = readMessage(deadline);
    if (!message)
      throw RenderError(method + " timed out");
    if (!message->contains("id")) {
      if (message->contains("method"))
        m_events.push_back(std::move(*message));
      continue;
    }
    if ((*message)["id"] != id)
      continue;
    if (message->contains("error")) {
      const json &error = (*message)["error"];
      std::string text = error.is_object() && error.contains("message") &&
                                 error["message"].is_string()
                             ? error["message"].get<std::string>()
                             : error.dump();
      throw RenderError(method + " failed: " + text);
    }
    return message->value("result", json::object());
  }
}

void DevToolsPipe::notify(const std::string &method, const json &params,
                          const std::string &sessionId) {
  send(method, params, sessionId);
}

bool DevToolsPipe::matches(const json &event, const std::string &method,
                           const std::string &sessionId,
                           const EventFilter &filter) const {
  if (event.value("method", "") != method)
    return false;
  if (!sessionId.empty() && event.value("sessionId", "") != sessionId)
    return false;
  return !filter || filter(event.value("params", json::object()));
}

bool DevToolsPipe::waitForEvent(const std::string &method,
                                const std::string &sessionId,
                                Clock::time_point deadline,
                                const EventFilter &filter) {
  for (auto it = m_events.begin(); it != m_events.end(); ++it) {
    if (matches(*it, method, sessionId, filter)) {
      m_events.erase(it);
      return true;
    }
  }
  for (;;) {
    auto message = readMessage(deadline);
    if (!message)
      return false;
    // Late replies to earlier commands carry an id and are dropped.
    if (message->contains("id") || !message->contains("method"))
      continue;
    if (matches(*message, method, sessionId, filter))
      return true;
    m_events.push_back(std::move(*message));
  }
}

std::optional<std::string> decodeBase64(const std::string &encoded) {
  std::string compact;
  compact.reserve(encoded.size());
  for (char c : encoded) {
    if (c != '\n' && c != '\r' && c != ' ' && c != '\t')
      compact += c;
  }
  if (compact.size() % 4 != 0)
    return std::nullopt;
  if (compact.empty())
    return std::string();

  std::string out(compact.size() / 4 * 3, '\0');
  int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                          reinterpret_cast<const unsigned char *>(compact.data()),
                          static_cast<int>(compact.size()));
  if (n < 0)
    return std::nullopt;
  std::size_t padding = 0;
  if (compact[compact.size() - 1] == '=')
    ++padding;
  if (compact[compact.size() - 2] == '=')
    ++padding;
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

} // namespace archiver
