#pragma once

#include <functional>
#include <memory>

#include "coro.hh"
#include "executor.hh"
#include "http/http.hh"
#include "io.hh"
#include "net.hh"
#include "runtime.hh"
#include "tools/tcp.hh"

namespace wren::http {

/* minimal http/1.1 server, one request per connection.
 * every connection is its own task on the runtime's executor */
class HttpServer
{
public:
  using App = std::function<Coro<Response>(Request)>;

  static IOResult<HttpServer> bind(Runtime& runtime, SocketAddr addr, App app);

  /* spawns the accept loop, the runtime has to be driven separately */
  void start();

  /* start() and then run the runtime, which never runs dry */
  void run();

  IOResult<SocketAddr> local_addr() const;

private:
  /* shared by the accept loop and every connection task,
   * nothing in it changes after bind() */
  struct Inner
  {
    Inner(TCPListener listener, App app, Executor::Spawner spawner)
      : listener(std::move(listener))
      , app(std::move(app))
      , spawner(std::move(spawner)) {};

    TCPListener listener;
    App app;
    Executor::Spawner spawner;
  };

  HttpServer(Runtime& runtime, std::shared_ptr<Inner> inner)
    : m_runtime(&runtime)
    , m_inner(std::move(inner)) {};

  static Coro<> accept_loop(std::shared_ptr<Inner> inner);
  static Coro<> connection(std::shared_ptr<Inner> inner,
                           TCPStream stream,
                           SocketAddr peer);
  static Coro<IOResult<Empty>> serve(Inner& inner,
                                     TCPStream& stream,
                                     SocketAddr peer);

  Runtime* m_runtime;
  std::shared_ptr<Inner> m_inner;
};

};
