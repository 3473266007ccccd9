#include "SnapshotRenderer.hpp"
#include "ArchiveErrors.hpp"
#include "DevToolsPipe.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace fs = std::filesystem;
using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace archiver {

namespace {

const char *const kBrowserNames[] = {"chromium", "chromium-browser",
                                     "google-chrome", "google-chrome-stable"};

bool isExecutable(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> searchPath(const std::string &name) {
  const char *pathEnv = std::getenv("PATH");
  if (!pathEnv)
    return std::nullopt;
  std::stringstream dirs(pathEnv);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty())
      continue;
    fs::path candidate = fs::path(dir) / name;
    if (isExecutable(candidate))
      return candidate.string();
  }
  return std::nullopt;
}

std::optional<std::string> resolveBinary(const std::string &nameOrPath) {
  if (nameOrPath.find('/') != std::string::npos) {
    if (isExecutable(nameOrPath))
      return nameOrPath;
    return std::nullopt;
  }
  return searchPath(nameOrPath);
}

constexpr std::chrono::seconds kStartupAllowance(10);
constexpr std::chrono::seconds kShotAllowance(15);

// Throwaway browser profile, removed after the capture.
class ProfileDir {
public:
  ProfileDir() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
      base = "/tmp";
    std::string templ = (base / "note-archiver-chrome-XXXXXX").string();
    if (::mkdtemp(templ.data()))
      m_path = templ;
    else
      std::cerr << "[Render] Cannot create browser profile: "
                << std::strerror(errno) << std::endl;
  }
  ~ProfileDir() {
    if (m_path.empty())
      return;
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }
  ProfileDir(const ProfileDir &) = delete;
  ProfileDir &operator=(const ProfileDir &) = delete;

  bool valid() const { return !m_path.empty(); }
  const std::string &path() const { return m_path; }

private:
  std::string m_path;
};

// Owns the spawned browser. Anything still running at destruction is
// killed and reaped.
class BrowserProcess {
public:
  explicit BrowserProcess(pid_t pid) : m_pid(pid) {}
  ~BrowserProcess() {
    if (m_pid <= 0)
      return;
    ::kill(m_pid, SIGKILL);
    int status = 0;
    while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  BrowserProcess(const BrowserProcess &) = delete;
  BrowserProcess &operator=(const BrowserProcess &) = delete;

  // True when the process exited before the deadline.
  bool waitForExit(std::chrono::steady_clock::time_point deadline) {
    while (m_pid > 0) {
      int status = 0;
      pid_t ret = ::waitpid(m_pid, &status, WNOHANG);
      if (ret == m_pid || (ret < 0 && errno != EINTR)) {
        m_pid = 0;
        return true;
      }
      if (std::chrono::steady_clock::now() >= deadline)
        return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
  }

private:
  pid_t m_pid;
};

// Page-space bounding box of the first element matching the selector.
std::optional<json> elementClip(DevToolsPipe &pipe, const std::string &session,
                                const std::string &selector,
                                Clock::time_point deadline) {
  if (selector.empty())
    return std::nullopt;
  const std::string expression =
      "(() => { const el = document.querySelector(" + json(selector).dump() +
      "); if (!el) return null; const r = el.getBoundingClientRect();"
      " return {x: r.left + window.scrollX, y: r.top + window.scrollY,"
      " width: r.width, height: r.height}; })()";
  json reply = pipe.call("Runtime.evaluate",
                         {{"expression", expression}, {"returnByValue", true}},
                         deadline, session);
  const json value = reply.value("result", json::object())
                         .value("value", json());
  if (!value.is_object() || !value.contains("width") ||
      !value.contains("height"))
    return std::nullopt;
  const double width = value["width"].get<double>();
  const double height = value["height"].get<double>();
  if (width <= 0 || height <= 0)
    return std::nullopt;
  return json{{"x", value.value("x", 0.0)},
              {"y", value.value("y", 0.0)},
              {"width", width},
              {"height", height},
              {"scale", 1}};
}

} // namespace

HeadlessChromeRenderer::HeadlessChromeRenderer(const std::string &configuredPath)
    : m_binary(locate(configuredPath)) {
  if (m_binary)
    std::cout << "[Render] Using browser " << *m_binary << std::endl;
  else
    std::cerr << "[Render] No headless browser found, snapshots disabled"
              << std::endl;
}

std::optional<std::string>
HeadlessChromeRenderer::locate(const std::string &configuredPath) {
  if (!configuredPath.empty())
    return resolveBinary(configuredPath);
  if (const char *env = std::getenv("ARCHIVER_BROWSER"); env && *env)
    return resolveBinary(env);
  for (const char *name : kBrowserNames) {
    if (auto found = searchPath(name))
      return found;
  }
  return std::nullopt;
}

bool HeadlessChromeRenderer::capture(const CaptureRequest &request) {
  if (!m_binary)
    return false;

  std::error_code ec;
  fs::remove(request.destPath, ec);

  ProfileDir profile;
  if (!profile.valid())
    return false;

  int sv[2] = {-1, -1};
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) < 0) {
    std::cerr << "[Render] socketpair failed: " << std::strerror(errno)
              << std::endl;
    return false;
  }
  DevToolsPipe pipe(sv[0]);
  // Keep the child's end clear of fds 3 and 4, which it is duplicated onto.
  int childEnd = sv[1];
  if (childEnd <= 4) {
    childEnd = fcntl(sv[1], F_DUPFD_CLOEXEC, 5);
    ::close(sv[1]);
    if (childEnd < 0) {
      std::cerr << "[Render] fcntl failed: " << std::strerror(errno)
                << std::endl;
      return false;
    }
  }

  std::vector<std::string> args = {
      *m_binary,
      "--headless=new",
      "--disable-gpu",
      "--hide-scrollbars",
      "--no-first-run",
      "--no-default-browser-check",
      "--remote-debugging-pipe",
      "--user-data-dir=" + profile.path(),
      "--window-size=" + std::to_string(request.viewportWidth) + "," +
          std::to_string(request.viewportHeight),
      "about:blank"};
  std::vector<char *> argv;
  for (auto &arg : args)
    argv.push_back(arg.data());
  argv.push_back(nullptr);

  pid_t pid = 0;
  {
    posix_spawn_file_actions_t actions;
    if ((errno = posix_spawn_file_actions_init(&actions))) {
      std::cerr << "[Render] posix_spawn_file_actions_init failed: "
                << std::strerror(errno) << std::endl;
      ::close(childEnd);
      return false;
    }
    if ((errno = posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO,
                                                  "/dev/null", O_WRONLY, 0)) ||
        (errno = posix_spawn_file_actions_addopen(&actions, STDERR_FILENO,
                                                  "/dev/null", O_WRONLY, 0)) ||
        (errno = posix_spawn_file_actions_adddup2(&actions, childEnd, 3)) ||
        (errno = posix_spawn_file_actions_adddup2(&actions, childEnd, 4))) {
      std::cerr << "[Render] Cannot set up browser descriptors: "
                << std::strerror(errno) << std::endl;
      posix_spawn_file_actions_destroy(&actions);
      ::close(childEnd);
      return false;
    }
    int rc = posix_spawn(&pid, m_binary->c_str(), &actions, nullptr,
                         argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    ::close(childEnd);
    if (rc != 0) {
      std::cerr << "[Render] Failed to start " << *m_binary << ": "
                << std::strerror(rc) << std::endl;
      return false;
    }
  }
  BrowserProcess browser(pid);

  try {
    bool saved = runCapture(pipe, request);
    // Browser.close may never be answered: the browser exits instead.
    pipe.notify("Browser.close", json::object());
    if (!browser.waitForExit(Clock::now() + std::chrono::seconds(5)))
      std::cerr << "[Render] Browser ignored Browser.close, killing it"
                << std::endl;
    return saved;
  } catch (const RenderError &e) {
    std::cerr << "[Render] Capture of " << request.url << " failed: "
              << e.what() << std::endl;
  } catch (const json::exception &e) {
    std::cerr << "[Render] Unexpected browser reply for " << request.url
              << ": " << e.what() << std::endl;
  }
  return false;
}

bool HeadlessChromeRenderer::runCapture(DevToolsPipe &pipe,
                                        const CaptureRequest &request) {
  const auto start = Clock::now();
  const auto navDeadline =
      start + kStartupAllowance + request.navigationTimeout;

  const std::string targetId =
      pipe.call("Target.createTarget", {{"url", "about:blank"}}, navDeadline)
          .at("targetId")
          .get<std::string>();
  const std::string session =
      pipe.call("Target.attachToTarget",
                {{"targetId", targetId}, {"flatten", true}}, navDeadline)
          .at("sessionId")
          .get<std::string>();

  pipe.call("Emulation.setDeviceMetricsOverride",
            {{"width", request.viewportWidth},
             {"height", request.viewportHeight},
             {"deviceScaleFactor", 1},
             {"mobile", false}},
            navDeadline, session);
  pipe.call("Page.enable", json::object(), navDeadline, session);
  pipe.call("Page.setLifecycleEventsEnabled", {{"enabled", true}}, navDeadline,
            session);
  pipe.discardEvents();

  json nav = pipe.call("Page.navigate", {{"url", request.url}}, navDeadline,
                       session);
  if (nav.contains("errorText") && nav["errorText"].is_string() &&
      !nav["errorText"].get<std::string>().empty())
    throw RenderError("navigation failed: " +
                      nav["errorText"].get<std::string>());
  const std::string loaderId = nav.value("loaderId", "");

  if (!pipe.waitForEvent("Page.loadEventFired", session, navDeadline))
    throw RenderError("navigation timed out");

  // Network quiescence is best effort.
  const auto idleDeadline = Clock::now() + request.quiescenceTimeout;
  bool idle = pipe.waitForEvent(
      "Page.lifecycleEvent", session, idleDeadline, [&](const json &params) {
        return params.value("name", "") == "networkIdle" &&
               (loaderId.empty() || params.value("loaderId", "") == loaderId);
      });
  if (!idle)
    std::cout << "[Render] Network still busy, capturing anyway: "
              << request.url << std::endl;

  const auto shotDeadline = Clock::now() + kShotAllowance;
  json screenshot = {{"format", "png"}};
  if (auto clip = elementClip(pipe, session, request.cardSelector,
                              shotDeadline)) {
    screenshot["clip"] = *clip;
    screenshot["captureBeyondViewport"] = true;
  }
  json shot = pipe.call("Page.captureScreenshot", screenshot, shotDeadline,
                        session);
  auto png = decodeBase64(shot.at("data").get<std::string>());
  if (!png || png->empty())
    throw RenderError("screenshot data is not valid base64");

  std::ofstream out(request.destPath, std::ios::binary | std::ios::trunc);
  out.write(png->data(), static_cast<std::streamsize>(png->size()));
  out.close();
  if (!out) {
    std::cerr << "[Render] Cannot write " << request.destPath << std::endl;
    return false;
  }
  return true;
}

} // namespace archiver
