#pragma once

#include <optional>
#include <sstream>
#include <string_view>

namespace wren::log {

enum class Level
{
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

/* process-wide threshold, defaults to Warn */
void set_level(Level);
Level level();
bool enabled(Level);

char const* to_string(Level);
/* accepts trace|debug|info|warn|error|off */
std::optional<Level> parse_level(std::string_view);

/* writes a single line to stderr. safe from any thread */
void write(Level, std::string_view message);

template<typename... Args>
void
emit(Level lvl, Args const&... args)
{
  if (!enabled(lvl))
    return;

  std::ostringstream out;
  (out << ... << args);
  write(lvl, out.str());
}

template<typename... Args>
void
trace(Args const&... args)
{
  emit(Level::Trace, args...);
}

template<typename... Args>
void
debug(Args const&... args)
{
  emit(Level::Debug, args...);
}

template<typename... Args>
void
info(Args const&... args)
{
  emit(Level::Info, args...);
}

template<typename... Args>
void
warn(Args const&... args)
{
  emit(Level::Warn, args...);
}

template<typename... Args>
void
error(Args const&... args)
{
  emit(Level::Error, args...);
}

};
