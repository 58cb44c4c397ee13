#include "synthex/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace synthex::log
{

  namespace
  {
    std::atomic<Level> g_level{Level::Info};

    const char* tag(Level lvl) noexcept
    {
      switch ( lvl ) {
        case Level::Debug:
          return "DEBUG";
        case Level::Info:
          return "INFO";
        case Level::Warn:
          return "WARN";
        case Level::Error:
          return "ERROR";
        case Level::Off:
          break;
      }
      return "?";
    }
  } // namespace

  void set_level(Level lvl) noexcept { g_level.store(lvl, std::memory_order_relaxed); }

  Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

  bool parse_level(std::string_view name, Level& out) noexcept
  {
    if ( name == "debug" )
      out = Level::Debug;
    else if ( name == "info" )
      out = Level::Info;
    else if ( name == "warn" )
      out = Level::Warn;
    else if ( name == "error" )
      out = Level::Error;
    else if ( name == "off" )
      out = Level::Off;
    else
      return false;
    return true;
  }

  void write(Level lvl, std::string_view msg) noexcept
  {
    if ( lvl == Level::Off || !enabled(lvl) )
      return;
    // Single fprintf so concurrent lines do not interleave.
    std::fprintf(stderr, "[%s] %.*s\n", tag(lvl), static_cast<int>(msg.size()), msg.data());
  }

  void fatal(const char* expr, const char* file, int line) noexcept
  {
    std::fprintf(stderr, "[FATAL] invariant violated: %s (%s:%d)\n", expr, file, line);
    std::fflush(stderr);
    std::abort();
  }

} // namespace synthex::log
