#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

#include "log.hh"

namespace wren::log {

static std::atomic<Level> g_level{ Level::Warn };
static std::mutex g_writeMutex;

void
set_level(Level lvl)
{
  g_level.store(lvl, std::memory_order_relaxed);
}

Level
level()
{
  return g_level.load(std::memory_order_relaxed);
}

bool
enabled(Level lvl)
{
  return lvl != Level::Off && lvl >= level();
}

char const*
to_string(Level lvl)
{
  switch (lvl) {
    case Level::Trace:
      return "trace";
    case Level::Debug:
      return "debug";
    case Level::Info:
      return "info";
    case Level::Warn:
      return "warn";
    case Level::Error:
      return "error";
    case Level::Off:
      return "off";
  }

  return "?";
}

std::optional<Level>
parse_level(std::string_view text)
{
  for (Level lvl : { Level::Trace,
                     Level::Debug,
                     Level::Info,
                     Level::Warn,
                     Level::Error,
                     Level::Off })
    if (text == to_string(lvl))
      return lvl;

  return std::nullopt;
}

void
write(Level lvl, std::string_view message)
{
  auto const now = std::chrono::system_clock::now();
  auto const tt = std::chrono::system_clock::to_time_t(now);
  auto const us = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch()) %
                  1000000;

  std::tm tm{};
  localtime_r(&tt, &tm);

  char stamp[32];
  std::snprintf(stamp,
                sizeof stamp,
                "%02d:%02d:%02d.%06lld",
                tm.tm_hour,
                tm.tm_min,
                tm.tm_sec,
                static_cast<long long>(us.count()));

  std::lock_guard lock(g_writeMutex);
  std::cerr << stamp << " [" << to_string(lvl) << "] " << message << '\n';
}

};
