#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "http/server.hh"
#include "http/static_router.hh"
#include "log.hh"
#include "net.hh"
#include "runtime.hh"

using namespace wren;

namespace {

struct Args
{
  std::string bind = "127.0.0.1";
  std::uint16_t port = 8989;
  std::filesystem::path root = ".";
  log::Level level = log::Level::Info;
};

void
usage(char const* argv0)
{
  std::cerr << "usage: " << argv0
            << " [--bind ADDR] [--port N] [--root DIR] [--log-level LEVEL]\n"
               "  LEVEL is one of trace, debug, info, warn, error, off\n";
}

std::optional<Args>
parse_args(int argc, char** argv)
{
  Args args;

  for (int i = 1; i < argc; i++) {
    std::string_view const flag = argv[i];

    if (i + 1 >= argc)
      return std::nullopt;
    std::string_view const value = argv[++i];

    if (flag == "--bind") {
      args.bind = value;
    } else if (flag == "--port") {
      auto const [end, ec] =
        std::from_chars(value.data(), value.data() + value.size(), args.port);
      if (ec != std::errc{} || end != value.data() + value.size())
        return std::nullopt;
    } else if (flag == "--root") {
      args.root = value;
    } else if (flag == "--log-level") {
      auto const level = log::parse_level(value);
      if (!level)
        return std::nullopt;
      args.level = *level;
    } else {
      return std::nullopt;
    }
  }

  return args;
}

};

int
main(int argc, char** argv)
{
  auto const args = parse_args(argc, argv);
  if (!args)
    return usage(argv[0]), 2;

  log::set_level(args->level);

  auto const addr =
    SocketAddr::parse(args->bind + ":" + std::to_string(args->port));
  if (!addr) {
    std::cerr << "invalid bind address " << args->bind << "\n";
    return usage(argv[0]), 2;
  }

  Runtime rt;
  http::StaticRouter router(rt.get_reactor(), args->root);

  auto server = http::HttpServer::bind(rt, *addr, router.app());
  if (!server) {
    log::error("binding ", *addr, ": ", describe(server.error()));
    return EXIT_FAILURE;
  }

  log::info("http server listening on ", *addr, ", serving ", args->root);
  try {
    server->run();
  } catch (std::system_error const& e) {
    log::error("event loop died: ", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
