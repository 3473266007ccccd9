#include "RenderRegistry.hpp"

namespace archiver {

RenderRegistry::Registration::Registration(RenderRegistry &registry,
                                           std::string token, std::string html)
    : m_registry(registry), m_token(std::move(token)) {
  m_registry.insert(m_token, std::move(html));
}

RenderRegistry::Registration::~Registration() { m_registry.remove(m_token); }

std::optional<std::string>
RenderRegistry::lookup(const std::string &token) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_pages.find(token);
  if (it == m_pages.end())
    return std::nullopt;
  return it->second;
}

std::size_t RenderRegistry::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pages.size();
}

void RenderRegistry::insert(const std::string &token, std::string html) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_pages[token] = std::move(html);
}

void RenderRegistry::remove(const std::string &token) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_pages.erase(token);
}

} // namespace archiver
