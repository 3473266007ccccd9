#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace archiver {

class DevToolsPipe;

struct CaptureRequest {
  std::string url;
  std::string destPath;
  int viewportWidth = 700;
  int viewportHeight = 900;
  std::chrono::milliseconds navigationTimeout{15000};
  std::chrono::milliseconds quiescenceTimeout{6000}; // best effort
  std::string cardSelector = ".card"; // empty: capture the viewport
};

/**
 * SnapshotRenderer turns a URL into a PNG on disk. capture() returns false
 * on any failure; implementations may throw only for unexpected errors,
 * which callers treat the same way.
 */
class SnapshotRenderer {
public:
  virtual ~SnapshotRenderer() = default;

  virtual bool available() const = 0;
  virtual bool capture(const CaptureRequest &request) = 0;
};

/**
 * Drives a headless Chromium/Chrome process per capture over the DevTools
 * pipe protocol. The binary is the configured path, else $ARCHIVER_BROWSER,
 * else the first known browser name found on PATH. The PNG is clipped to
 * the element matching cardSelector; without a match it is the viewport.
 */
class HeadlessChromeRenderer : public SnapshotRenderer {
public:
  explicit HeadlessChromeRenderer(const std::string &configuredPath = "");

  bool available() const override { return m_binary.has_value(); }
  bool capture(const CaptureRequest &request) override;

  static std::optional<std::string> locate(const std::string &configuredPath);

  // The protocol conversation of one capture, on a browser already attached
  // to `pipe`. Throws RenderError on protocol failures.
  static bool runCapture(DevToolsPipe &pipe, const CaptureRequest &request);

private:
  std::optional<std::string> m_binary;
};

} // namespace archiver
