#include "LocalServer.hpp"
#include "ArchiveErrors.hpp"
#include "HtmlMirror.hpp"
#include "InputResolver.hpp"
#include "JsonCodec.hpp"
#include "PostExporter.hpp"
#include <exception>
#include <fstream>
#include <httplib.h>
#include <iostream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace archiver {

namespace {

const char *const kJson = "application/json";
const char *const kHtml = "text/html; charset=utf-8";

void sendJson(httplib::Response &res, const json &body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), kJson);
}

void sendError(httplib::Response &res, int status, const std::string &message) {
  sendJson(res, json{{"error", message}}, status);
}

void sendNotFound(httplib::Response &res) {
  res.status = 404;
  res.set_content("Not found", "text/plain");
}

// Maps the archiver's exception hierarchy onto HTTP statuses.
template <typename Handler>
void guarded(httplib::Response &res, const char *route, Handler handler) {
  try {
    handler();
  } catch (const InputError &e) {
    sendError(res, 400, e.what());
  } catch (const RemoteError &e) {
    std::cerr << "[Server] " << route << ": " << e.what() << std::endl;
    sendError(res, 502, e.what());
  } catch (const std::exception &e) {
    std::cerr << "[Server] " << route << ": " << e.what() << std::endl;
    sendError(res, 500, e.what());
  }
}

int maxPostsFrom(const json &body, int fallback) {
  if (!body.contains("max_posts") || body["max_posts"].is_null())
    return fallback;
  const auto &value = body["max_posts"];
  std::optional<long long> parsed;
  if (value.is_number_unsigned()) {
    auto raw = value.get<unsigned long long>();
    if (raw <= static_cast<unsigned long long>(std::numeric_limits<int>::max()))
      parsed = static_cast<long long>(raw);
  } else if (value.is_number_integer()) {
    parsed = value.get<long long>();
  } else if (value.is_string()) {
    const std::string text = value.get<std::string>();
    try {
      std::size_t used = 0;
      long long number = std::stoll(text, &used);
      if (used == text.size())
        parsed = number;
    } catch (const std::exception &) {
      // reported below
    }
  }
  if (!parsed || *parsed < std::numeric_limits<int>::min() ||
      *parsed > std::numeric_limits<int>::max())
    throw InputError(InputErrorKind::InvalidArgument,
                     "max_posts must be an integer");
  return static_cast<int>(*parsed);
}

std::string inputFrom(const json &body) {
  if (!body.contains("input") || body["input"].is_null())
    return "";
  if (!body["input"].is_string())
    throw InputError(InputErrorKind::InvalidArgument, "input must be a string");
  return body["input"].get<std::string>();
}

} // namespace

struct LocalServer::Impl {
  httplib::Server server;
  std::thread thread;
};

LocalServer::LocalServer(RenderRegistry &registry, const std::string &mediaRoot,
                         std::string host)
    : m_host(std::move(host)), m_impl(std::make_unique<Impl>()) {
  auto &server = m_impl->server;

  server.Get(R"(/render/([A-Za-z0-9]+))",
             [&registry](const httplib::Request &req, httplib::Response &res) {
               auto html = registry.lookup(req.matches[1]);
               if (!html) {
                 sendNotFound(res);
                 return;
               }
               res.set_content(*html, kHtml);
             });

  if (!server.set_mount_point("/media", mediaRoot))
    std::cerr << "[Server] Media directory not mountable: " << mediaRoot
              << std::endl;
}

LocalServer::~LocalServer() { stop(); }

std::optional<int> LocalServer::bindFreePort(int preferred, int span) {
  for (int port = preferred; port < preferred + span; ++port) {
    if (m_impl->server.bind_to_port(m_host, port)) {
      m_port = port;
      std::cout << "[Server] Bound " << m_host << ":" << port << std::endl;
      return port;
    }
  }
  std::cerr << "[Server] No free port in " << preferred << "-"
            << preferred + span - 1 << std::endl;
  return std::nullopt;
}

std::string LocalServer::baseUrl() const {
  return "http://" + m_host + ":" + std::to_string(m_port);
}

void LocalServer::mountApi(const ApiContext &context) {
  auto &server = m_impl->server;
  ApiContext ctx = context;

  server.Get("/", [ctx](const httplib::Request &, httplib::Response &res) {
    guarded(res, "/", [&] {
      res.set_content(HtmlMirror::renderListing(ctx.store.listPosts()), kHtml);
    });
  });

  server.Get(R"(/post/(.+))",
             [ctx](const httplib::Request &req, httplib::Response &res) {
               guarded(res, "/post", [&] {
                 const std::string postId = req.matches[1];
                 auto post = ctx.store.getPost(postId);
                 if (!post) {
                   sendNotFound(res);
                   return;
                 }
                 res.set_content(HtmlMirror::renderPost(*post,
                                                        ctx.store.listMedia(postId),
                                                        ctx.store.mediaRoot()),
                                 kHtml);
               });
             });

  server.Get(R"(/screenshot/(.+))",
             [ctx](const httplib::Request &req, httplib::Response &res) {
               guarded(res, "/screenshot", [&] {
                 auto post = ctx.store.getPost(req.matches[1]);
                 if (!post || !post->screenshotPath ||
                     post->screenshotPath->empty()) {
                   sendNotFound(res);
                   return;
                 }
                 std::ifstream in(*post->screenshotPath, std::ios::binary);
                 if (!in) {
                   sendNotFound(res);
                   return;
                 }
                 std::string bytes((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
                 res.set_content(bytes, "image/png");
               });
             });

  server.Get(R"(/download/(.+))",
             [ctx](const httplib::Request &req, httplib::Response &res) {
               guarded(res, "/download", [&] {
                 const std::string postId = req.matches[1];
                 auto bundle = PostExporter(ctx.store).buildBundle(postId);
                 if (!bundle) {
                   sendNotFound(res);
                   return;
                 }
                 auto zip = PostExporter::zipBundle(*bundle);
                 if (!zip) {
                   sendError(res, 500, "Could not build the archive");
                   return;
                 }
                 res.set_header("Content-Disposition",
                                "attachment; filename=\"" +
                                    PostExporter::archiveFileName(postId) +
                                    "\"");
                 res.set_content(*zip, "application/zip");
               });
             });

  server.Post("/api/archive", [ctx](const httplib::Request &req,
                                    httplib::Response &res) {
    guarded(res, "/api/archive", [&] {
      json body = json::parse(req.body, nullptr, false);
      if (body.is_discarded() || !body.is_object())
        throw InputError(InputErrorKind::InvalidArgument,
                         "Request body must be a JSON object");
      const std::string input = inputFrom(body);
      const std::string instanceOverride =
          body.contains("instance") && body["instance"].is_string()
              ? body["instance"].get<std::string>()
              : ctx.defaultInstance;
      const int maxPosts = maxPostsFrom(body, ctx.defaultMaxPosts);

      FetchTarget target = InputResolver::resolve(input);
      const std::string instance =
          InputResolver::resolveInstance(target, instanceOverride);

      if (auto *note = std::get_if<NoteTarget>(&target)) {
        sendJson(res, json(ctx.pipeline.archiveSingle(instance, note->noteId)));
        return;
      }
      const auto &user = std::get<UserTarget>(target);
      if (maxPosts <= 0)
        throw InputError(InputErrorKind::InvalidArgument,
                         "max_posts must be a positive number");
      const std::string jobId =
          ctx.jobs.startUserArchive(instance, user.username, maxPosts);
      sendJson(res, json{{"status", "started"},
                         {"job_id", jobId},
                         {"user", user.username},
                         {"instance", instance}});
    });
  });

  server.Get("/api/progress",
             [ctx](const httplib::Request &req, httplib::Response &res) {
               auto job = ctx.jobs.archiveJob(req.get_param_value("job"));
               if (!job) {
                 sendJson(res, json{{"status", "unknown"}});
                 return;
               }
               sendJson(res, json(*job));
             });

  server.Post("/api/retake-screenshots",
              [ctx](const httplib::Request &, httplib::Response &res) {
                guarded(res, "/api/retake-screenshots", [&] {
                  sendJson(res, json(ctx.jobs.startScreenshotBackfill()));
                });
              });

  server.Get("/api/screenshot-progress",
             [ctx](const httplib::Request &, httplib::Response &res) {
               sendJson(res, json(ctx.jobs.screenshotBackfill()));
             });

  server.Get("/api/posts",
             [ctx](const httplib::Request &, httplib::Response &res) {
               guarded(res, "/api/posts",
                       [&] { sendJson(res, json(ctx.store.listPosts())); });
             });

  server.Get("/api/renderer-status",
             [ctx](const httplib::Request &, httplib::Response &res) {
               sendJson(res, json{{"available", ctx.snapshots.available()}});
             });
}

bool LocalServer::start() {
  if (m_port == 0) {
    std::cerr << "[Server] start() called before a port was bound"
              << std::endl;
    return false;
  }
  m_impl->thread = std::thread([this] {
    if (!m_impl->server.listen_after_bind())
      std::cerr << "[Server] Listener stopped with an error" << std::endl;
  });
  m_impl->server.wait_until_ready();
  std::cout << "[Server] Listening on " << baseUrl() << std::endl;
  return true;
}

void LocalServer::stop() {
  if (!m_impl)
    return;
  m_impl->server.stop();
  if (m_impl->thread.joinable())
    m_impl->thread.join();
}

} // namespace archiver
