#include "HtmlMirror.hpp"
#include "UrlUtils.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace archiver {

namespace {

const char *const kStyle = R"CSS(
  :root{--bg:#0f1117;--card:#1a1d2e;--border:#2d3154;--accent:#7c6ff7;--text:#e2e4ef;--muted:#8b8fa8;--cw:#f59e0b}
  *{box-sizing:border-box;margin:0;padding:0}
  body{background:var(--bg);color:var(--text);font-family:system-ui,sans-serif;padding:2rem 1rem}
  .card{max-width:640px;margin:0 auto 1rem;background:var(--card);border:1px solid var(--border);border-radius:16px;overflow:hidden}
  .card-header{padding:1.25rem 1.5rem;border-bottom:1px solid var(--border);display:flex;align-items:center;gap:1rem}
  .avatar{width:48px;height:48px;border-radius:50%;background:var(--border);object-fit:cover}
  .name{font-weight:700}.handle{color:var(--muted);font-size:.85rem}
  .card-body{padding:1.5rem}
  .cw-warning{background:rgba(245,158,11,.15);border:1px solid var(--cw);color:var(--cw);padding:.75rem 1rem;border-radius:8px;margin-bottom:1rem;cursor:pointer}
  .content{line-height:1.7}.hidden{display:none}
  .media-grid{display:grid;grid-template-columns:repeat(auto-fit,minmax(240px,1fr));gap:.75rem;margin-top:1.25rem}
  .media-item{border-radius:10px;overflow:hidden;background:#000}
  .media-item img,.media-item video{width:100%;display:block;max-height:480px;object-fit:cover}
  .media-item.sensitive img,.media-item.sensitive video{filter:blur(20px)}
  .media-item.sensitive:hover img,.media-item.sensitive:hover video{filter:none}
  figcaption{padding:.4rem .6rem;font-size:.75rem;color:var(--muted)}
  .card-footer{padding:1rem 1.5rem;border-top:1px solid var(--border);font-size:.85rem;color:var(--muted);display:flex;flex-wrap:wrap;gap:.75rem;align-items:center}
  .badge{background:var(--border);padding:.2rem .6rem;border-radius:99px;font-size:.75rem}
  a{color:var(--accent)}
)CSS";

std::string withLineBreaks(const std::string &escaped) {
  std::string out;
  out.reserve(escaped.size());
  for (char c : escaped) {
    if (c == '\n')
      out += "<br>";
    else
      out += c;
  }
  return out;
}

void writeHead(std::ostringstream &html, const std::string &title) {
  html << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
       << "<meta charset=\"UTF-8\"><meta name=\"viewport\" "
          "content=\"width=device-width,initial-scale=1\">\n"
       << "<title>" << HtmlMirror::escape(title) << "</title>\n"
       << "<style>" << kStyle << "</style>\n</head>\n<body>\n";
}

} // namespace

std::string HtmlMirror::escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string HtmlMirror::mediaUrl(const MediaRecord &media,
                                 const std::string &mediaRoot) {
  if (media.localPath && !mediaRoot.empty()) {
    fs::path rel = fs::path(*media.localPath).lexically_relative(mediaRoot);
    if (!rel.empty() && rel.begin()->string() != "..") {
      std::string url = "/media";
      for (const auto &part : rel)
        url += "/" + UrlUtils::urlEncode(part.string());
      return url;
    }
  }
  return media.url;
}

std::string HtmlMirror::bundledMediaUrl(const MediaRecord &media) {
  if (!media.localPath)
    return media.url;
  return "media/" +
         UrlUtils::urlEncode(fs::path(*media.localPath).filename().string());
}

std::string HtmlMirror::renderPost(const PostRecord &post,
                                   const std::vector<MediaRecord> &media,
                                   const std::string &mediaRoot,
                                   MediaLinks links) {
  std::ostringstream items;
  for (const auto &m : media) {
    const std::string src = escape(links == MediaLinks::Bundled
                                       ? bundledMediaUrl(m)
                                       : mediaUrl(m, mediaRoot));
    const std::string alt = escape(m.altText.empty() ? m.filename : m.altText);
    const std::string cls =
        std::string("media-item") + (m.isSensitive ? " sensitive" : "");
    if (m.mimeType.rfind("image/", 0) == 0)
      items << "<figure class=\"" << cls << "\"><img src=\"" << src
            << "\" alt=\"" << alt << "\" loading=\"lazy\"><figcaption>" << alt
            << "</figcaption></figure>\n";
    else if (m.mimeType.rfind("video/", 0) == 0)
      items << "<figure class=\"" << cls << "\"><video src=\"" << src
            << "\" controls></video><figcaption>" << alt
            << "</figcaption></figure>\n";
    else if (m.mimeType.rfind("audio/", 0) == 0)
      items << "<figure class=\"" << cls << "\"><audio src=\"" << src
            << "\" controls></audio><figcaption>" << alt
            << "</figcaption></figure>\n";
  }
  const std::string mediaHtml = items.str();
  const bool hasCw = post.cw && !post.cw->empty();

  std::ostringstream html;
  writeHead(html, "Archived post by " + post.userHandle);
  html << "<div class=\"card\">\n  <div class=\"card-header\">\n    ";
  if (!post.userAvatar.empty())
    html << "<img class=\"avatar\" src=\"" << escape(post.userAvatar)
         << "\" alt=\"\">";
  else
    html << "<div class=\"avatar\"></div>";
  html << "\n    <div><div class=\"name\">"
       << escape(post.userName.empty() ? post.userHandle : post.userName)
       << "</div><div class=\"handle\">" << escape(post.userHandle)
       << "</div></div>\n"
       << "    <div style=\"margin-left:auto\"><span class=\"badge\">Archived"
          "</span></div>\n  </div>\n  <div class=\"card-body\">\n";
  if (hasCw)
    html << "    <div class=\"cw-warning\" onclick=\"document.getElementById("
            "'pc').classList.toggle('hidden')\"><strong>Content Warning:"
            "</strong> "
         << escape(*post.cw) << " <em>(click to reveal)</em></div>\n";
  html << "    <div class=\"content" << (hasCw ? " hidden" : "")
       << "\" id=\"pc\">" << withLineBreaks(escape(post.content)) << "</div>\n";
  if (!mediaHtml.empty())
    html << "    <div class=\"media-grid\">\n" << mediaHtml << "    </div>\n";
  html << "  </div>\n  <div class=\"card-footer\">\n"
       << "    <span>Replies " << post.replyCount << "</span>\n"
       << "    <span>Renotes " << post.renoteCount << "</span>\n"
       << "    <span>Reactions " << post.reactionCount << "</span>\n"
       << "    <span class=\"badge\">" << escape(post.visibility) << "</span>\n"
       << "    <span style=\"margin-left:auto\">Posted: "
       << escape(post.createdAt.substr(0, 10)) << "</span>\n"
       << "    <a href=\"" << escape(post.url)
       << "\" target=\"_blank\" rel=\"noopener\">Original</a>\n"
       << "  </div>\n</div>\n</body></html>";
  return html.str();
}

std::string HtmlMirror::renderListing(const std::vector<PostSummary> &posts) {
  std::ostringstream html;
  writeHead(html, "Archived posts");
  html << "<h1 style=\"max-width:640px;margin:0 auto 1.5rem\">Archived posts ("
       << posts.size() << ")</h1>\n";
  for (const auto &summary : posts) {
    const PostRecord &post = summary.post;
    std::string excerpt = post.content.substr(0, 280);
    html << "<div class=\"card\"><div class=\"card-body\">"
         << "<div class=\"name\">"
         << escape(post.userName.empty() ? post.userHandle : post.userName)
         << " <span class=\"handle\">" << escape(post.userHandle)
         << "</span></div>\n<div class=\"content\">"
         << withLineBreaks(escape(excerpt)) << "</div></div>\n"
         << "<div class=\"card-footer\"><span>" << summary.mediaCount
         << " media</span><span>Archived " << escape(post.archivedAt.substr(0, 10))
         << "</span><a href=\"/post/" << escape(post.id) << "\">Mirror</a>";
    if (post.screenshotPath && !post.screenshotPath->empty())
      html << "<a href=\"/screenshot/" << escape(post.id) << "\">Snapshot</a>";
    html << "<a href=\"" << escape(post.url)
         << "\" target=\"_blank\" rel=\"noopener\">Original</a></div></div>\n";
  }
  html << "</body></html>";
  return html.str();
}

} // namespace archiver
