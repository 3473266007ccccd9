#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace archiver {

struct HttpResponse {
  int status = 0;
  std::string body;
  std::string contentType;
};

/**
 * HttpTransport is the seam between the archiver and the network.
 * Implementations throw TransportError when no HTTP response was obtained
 * (connection refused, TLS failure, timeout). Any HTTP status, including
 * 4xx/5xx, is returned as a response.
 */
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse post(const std::string &url, const std::string &body,
                            const std::string &contentType,
                            std::chrono::seconds timeout) = 0;

  virtual HttpResponse get(const std::string &url,
                           std::chrono::seconds timeout) = 0;
};

/**
 * HttplibTransport performs requests with cpp-httplib, one client per
 * request origin. https origins need the OpenSSL build of httplib.
 */
class HttplibTransport : public HttpTransport {
public:
  explicit HttplibTransport(std::string userAgent = "NoteArchiver/1.0");
  ~HttplibTransport() override;

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::string &contentType,
                    std::chrono::seconds timeout) override;

  HttpResponse get(const std::string &url,
                   std::chrono::seconds timeout) override;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace archiver
