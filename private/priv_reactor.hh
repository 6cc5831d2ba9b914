#pragma once

#include <optional>
#include <sys/epoll.h>
#include <vector>

#include "io.hh"
#include "reactor.hh"

namespace wren {

/* per token bookkeeping. a node exists exactly as long as
 * epoll holds the matching registration */
struct ReactorNode
{
  Ready readiness{ Ready::None };
  Waker read_waker{};
  Waker write_waker{};
};

struct Reactor::Data
{
  FileDesc epoll;
  std::vector<epoll_event> events;

  /* slab of nodes indexed by token, freed slots get reused */
  std::vector<std::optional<ReactorNode>> nodes;
  std::vector<Token> free_tokens;
  std::size_t used = 0;

  Token allocate();
  void release(Token token);

  ReactorNode* find(Token token);
  ReactorNode& at(Token token);
};

};
