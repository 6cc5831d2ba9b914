#include <array>
#include <span>
#include <string>

#include "http/server.hh"
#include "log.hh"
#include "task.hh"

using namespace wren;
using namespace wren::http;

/* a request has to fit in a single read of this size */
static constexpr std::size_t RequestBufferSize = 1024;

IOResult<HttpServer>
HttpServer::bind(Runtime& runtime, SocketAddr addr, App app)
{
  auto listener = TCPListener::bind(runtime.get_reactor(), addr);
  if (!listener)
    return std::unexpected(listener.error());

  auto inner = std::make_shared<Inner>(
    std::move(*listener), std::move(app), runtime.spawner());
  return HttpServer(runtime, std::move(inner));
}

void
HttpServer::start()
{
  m_inner->spawner.spawn(accept_loop(m_inner));
}

void
HttpServer::run()
{
  start();
  m_runtime->run();
}

IOResult<SocketAddr>
HttpServer::local_addr() const
{
  return m_inner->listener.local_addr();
}

Coro<>
HttpServer::accept_loop(std::shared_ptr<Inner> inner)
{
  for (;;) {
    auto accepted = co_await inner->listener.accept();

    if (!accepted) {
      log::warn("accept: ", describe(accepted.error()));

      /* the listener may stay readable on a persistent error,
       * let everything else run before trying again */
      co_await yield_now();
      continue;
    }

    auto& [stream, peer] = *accepted;
    log::info("accepted ", peer);
    inner->spawner.spawn(connection(inner, std::move(stream), peer));
  }
}

Coro<>
HttpServer::connection(std::shared_ptr<Inner> inner,
                       TCPStream stream,
                       SocketAddr peer)
{
  auto const res = co_await serve(*inner, stream, peer);
  if (!res)
    log::warn("connection with ", peer, ": ", describe(res.error()));

  co_return {};
}

Coro<IOResult<Empty>>
HttpServer::serve(Inner& inner, TCPStream& stream, SocketAddr peer)
{
  std::array<std::byte, RequestBufferSize> buf{};

  auto const len = co_await stream.read(buf);
  if (!len)
    co_return std::unexpected(len.error());

  log::trace("incoming message from ", peer, " (", *len, " bytes)");

  auto req = parse_request(std::span(buf.data(), *len));
  if (!req) {
    log::debug("ignoring malformed request from ", peer);
    co_return Empty{};
  }

  log::debug(peer, " ", req->method(), " ", req->uri());

  Response res = co_await inner.app(std::move(*req));
  if (!res.header("content-length"))
    res.set_header("Content-Length", std::to_string(res.body_len()));

  log::debug(peer, " <- ", res.status_code().code());

  auto const bytes = serialize_response(res);
  auto const written = co_await write_all(stream, bytes);
  if (!written)
    co_return std::unexpected(written.error());

  co_return Empty{};
}
