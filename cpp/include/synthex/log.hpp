#pragma once

#include <cstdint>
#include <string_view>

namespace synthex::log
{

  enum class Level : std::uint8_t
  {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
  };

  // Process-wide threshold. Messages below it are dropped.
  void set_level(Level lvl) noexcept;
  Level level() noexcept;

  // Parses "debug" / "info" / "warn" / "error" / "off". Returns false on unknown names.
  bool parse_level(std::string_view name, Level& out) noexcept;

  // One line per call on stderr: "[LEVEL] msg". Safe to call from any thread.
  void write(Level lvl, std::string_view msg) noexcept;

  inline bool enabled(Level lvl) noexcept { return lvl >= level(); }

  inline void debug(std::string_view msg) noexcept { write(Level::Debug, msg); }
  inline void info(std::string_view msg) noexcept { write(Level::Info, msg); }
  inline void warn(std::string_view msg) noexcept { write(Level::Warn, msg); }
  inline void error(std::string_view msg) noexcept { write(Level::Error, msg); }

  [[noreturn]] void fatal(const char* expr, const char* file, int line) noexcept;

} // namespace synthex::log

// Book/matching invariants. A violation means corrupted matching state, so it is
// fatal in every build type (unlike assert()).
#ifndef SYNTHEX_ASSERT
#  define SYNTHEX_ASSERT(x) \
    ((x) ? static_cast<void>(0) : ::synthex::log::fatal(#x, __FILE__, __LINE__))
#endif
