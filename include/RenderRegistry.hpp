#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace archiver {

/**
 * RenderRegistry holds HTML documents served at /render/<token> while the
 * snapshot renderer visits them. Entries only exist for the lifetime of a
 * Registration, so a page can never outlive the capture that needed it.
 */
class RenderRegistry {
public:
  class Registration {
  public:
    Registration(RenderRegistry &registry, std::string token,
                 std::string html);
    ~Registration();

    Registration(const Registration &) = delete;
    Registration &operator=(const Registration &) = delete;

    const std::string &token() const { return m_token; }

  private:
    RenderRegistry &m_registry;
    std::string m_token;
  };

  std::optional<std::string> lookup(const std::string &token) const;
  std::size_t size() const;

private:
  void insert(const std::string &token, std::string html);
  void remove(const std::string &token);

  mutable std::mutex m_mutex;
  std::unordered_map<std::string, std::string> m_pages;
};

} // namespace archiver
