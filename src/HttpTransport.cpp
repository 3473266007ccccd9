#include "HttpTransport.hpp"
#include "ArchiveErrors.hpp"
#include "UrlUtils.hpp"
#include <httplib.h>

namespace archiver {

struct HttplibTransport::Impl {
  std::string userAgent;

  std::unique_ptr<httplib::Client> makeClient(const std::string &origin,
                                              std::chrono::seconds timeout) {
    auto client = std::make_unique<httplib::Client>(origin);
    if (!client->is_valid())
      throw TransportError("Unsupported or invalid origin: " + origin);
    client->set_connection_timeout(static_cast<time_t>(timeout.count()), 0);
    client->set_read_timeout(static_cast<time_t>(timeout.count()), 0);
    client->set_write_timeout(static_cast<time_t>(timeout.count()), 0);
    client->set_follow_location(true);
    return client;
  }

  HttpResponse toResponse(const httplib::Result &res, const char *method,
                          const std::string &url) {
    if (!res)
      throw TransportError(std::string(method) + " " + url + " failed: " +
                           httplib::to_string(res.error()));
    HttpResponse out;
    out.status = res->status;
    out.body = res->body;
    out.contentType = res->get_header_value("Content-Type");
    return out;
  }
};

HttplibTransport::HttplibTransport(std::string userAgent)
    : m_impl(std::make_unique<Impl>()) {
  m_impl->userAgent = std::move(userAgent);
}

HttplibTransport::~HttplibTransport() = default;

HttpResponse HttplibTransport::post(const std::string &url,
                                    const std::string &body,
                                    const std::string &contentType,
                                    std::chrono::seconds timeout) {
  auto [origin, path] = UrlUtils::splitOrigin(url);
  auto client = m_impl->makeClient(origin, timeout);
  httplib::Headers headers{{"User-Agent", m_impl->userAgent}};
  auto res = client->Post(path, headers, body, contentType);
  return m_impl->toResponse(res, "POST", url);
}

HttpResponse HttplibTransport::get(const std::string &url,
                                   std::chrono::seconds timeout) {
  auto [origin, path] = UrlUtils::splitOrigin(url);
  auto client = m_impl->makeClient(origin, timeout);
  httplib::Headers headers{{"User-Agent", m_impl->userAgent}};
  auto res = client->Get(path, headers);
  return m_impl->toResponse(res, "GET", url);
}

} // namespace archiver
