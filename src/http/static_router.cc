#include <algorithm>
#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

#include "http/static_router.hh"
#include "log.hh"
#include "tools/file.hh"

using namespace wren;
using namespace wren::http;

namespace fs = std::filesystem;

namespace {

std::string
escape_html(std::string_view str)
{
  std::string out;
  out.reserve(str.size());

  for (char c : str) {
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
      default:
        out += c;
    }
  }

  return out;
}

/* request uri minus query and fragment */
std::string_view
strip_uri(std::string_view uri)
{
  return uri.substr(0, uri.find_first_of("?#"));
}

bool
has_parent_segment(std::string_view path)
{
  while (!path.empty()) {
    auto const slash = path.find('/');
    if (path.substr(0, slash) == "..")
      return true;
    if (slash == std::string_view::npos)
      break;
    path.remove_prefix(slash + 1);
  }
  return false;
}

};

StaticRouter::StaticRouter(Reactor& reactor, fs::path root)
  : StaticRouter(reactor, std::move(root), OffloadQueue::global()) {};

StaticRouter::StaticRouter(Reactor& reactor,
                           fs::path root,
                           OffloadQueue& queue)
  : m_reactor(&reactor)
  , m_queue(&queue)
  , m_root(std::move(root)) {};

HttpServer::App
StaticRouter::app() const
{
  return [router = *this](Request req) { return router.route(std::move(req)); };
}

Coro<Response>
StaticRouter::route(Request req) const
{
  std::string_view const uri = strip_uri(req.uri());

  if (has_parent_segment(uri)) {
    log::debug("refusing ", uri);
    co_return Response::with_status_code(StatusCode::BadRequest);
  }

  std::string_view relative = uri;
  while (!relative.empty() && relative.front() == '/')
    relative.remove_prefix(1);

  fs::path const path = m_root / relative;

  std::error_code ec;
  auto const status = fs::status(path, ec);

  if (ec || !fs::exists(status))
    co_return Response::with_status_code(StatusCode::NotFound);

  if (fs::is_directory(status))
    co_return dir_page(path, uri);

  /* fifos and devices can block the offload worker on open */
  if (!fs::is_regular_file(status)) {
    log::debug("refusing non regular file ", path.string());
    co_return Response::with_status_code(StatusCode::NotFound);
  }

  co_return co_await serve_file(path);
}

Coro<Response>
StaticRouter::serve_file(fs::path path) const
{
  auto file = co_await File::open(*m_reactor, path.string(), *m_queue);
  if (!file) {
    log::warn("opening ", path.string(), ": ", describe(file.error()));
    co_return Response::with_status_code(
      file.error() == ENOENT ? StatusCode::NotFound
                             : StatusCode::InternalServerError);
  }

  auto const size = file->size();
  if (!size) {
    log::warn("stat ", path.string(), ": ", describe(size.error()));
    co_return Response::with_status_code(StatusCode::InternalServerError);
  }

  std::vector<std::byte> buf(*size);
  auto const len = co_await read_all(*file, buf);
  if (!len) {
    log::warn("reading ", path.string(), ": ", describe(len.error()));
    co_return Response::with_status_code(StatusCode::InternalServerError);
  }

  Response res = Response::ok();
  res.extend(std::span(buf.data(), *len));
  co_return res;
}

Response
StaticRouter::dir_page(fs::path const& path, std::string_view uri) const
{
  std::error_code ec;
  std::vector<std::string> names;

  for (fs::directory_iterator it(path, ec), end; !ec && it != end;
       it.increment(ec))
    names.push_back(it->path().filename().string());

  if (ec) {
    log::warn("listing ", path.string(), ": ", ec.message());
    return Response::with_status_code(StatusCode::InternalServerError);
  }

  std::sort(names.begin(), names.end());

  std::string base(uri);
  if (base.empty() || base.back() != '/')
    base += '/';

  std::string const title = escape_html(uri.empty() ? "/" : uri);

  std::string page = "<html><head><title>" + title +
                     "</title></head><body><h1>" + title + "</h1><ul>";
  for (auto const& name : names)
    page += "<li><a href=\"" + escape_html(base + name) + "\">" +
            escape_html(name) + "</a></li>";
  page += "</ul></body></html>";

  Response res = Response::ok();
  res.set_header("Content-Type", "text/html; charset=utf-8");
  res.extend(page);
  return res;
}
