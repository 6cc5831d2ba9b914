#pragma once

#include <filesystem>
#include <string_view>

#include "coro.hh"
#include "http/http.hh"
#include "http/server.hh"
#include "offload.hh"
#include "reactor.hh"

namespace wren::http {

/* serves the tree below a root directory.
 * files are read through the offload queue, directories get a
 * plain html listing. */
class StaticRouter
{
public:
  StaticRouter(Reactor& reactor, std::filesystem::path root);
  StaticRouter(Reactor& reactor,
               std::filesystem::path root,
               OffloadQueue& queue);

  Coro<Response> route(Request req) const;

  /* the router is copied into the returned app */
  HttpServer::App app() const;

  std::filesystem::path const& root() const { return m_root; }

private:
  Coro<Response> serve_file(std::filesystem::path path) const;
  Response dir_page(std::filesystem::path const& path,
                    std::string_view uri) const;

  Reactor* m_reactor;
  OffloadQueue* m_queue;
  std::filesystem::path m_root;
};

};
