#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace clio {

// =============================================================================
// Level
// -----------------------------------------------------------------------------
// Importance of a message, ordered from least to most verbose. The same
// enumeration is used as the threshold of the output state: a message at
// level L is shown iff threshold >= L. Silent is only meaningful as a
// threshold, nothing is ever emitted at Silent.
// =============================================================================
enum class Level : std::uint8_t {
  Silent = 0,
  Error = 1,
  Warn = 2,
  Status = 3,
  Info = 4,
  Debug = 5,
  Trace = 6
};

inline constexpr Level kDefaultLevel = Level::Status;

[[nodiscard]] constexpr auto
should_emit(const Level threshold, const Level level) noexcept -> bool
{
  return level != Level::Silent && threshold >= level;
}

// Maps a count of -v flags to a threshold: 0 -> Status, 1 -> Info,
// 2 -> Debug, anything above saturates at Trace.
[[nodiscard]] constexpr auto
level_from_verbosity(const unsigned verbosity) noexcept -> Level
{
  switch (verbosity) {
    case 0:
      return Level::Status;
    case 1:
      return Level::Info;
    case 2:
      return Level::Debug;
    default:
      return Level::Trace;
  }
}

[[nodiscard]] auto to_string(Level level) -> std::string_view;

// Accepts a level name (case-insensitive, "warning" is an alias of "warn")
// or its numeric index. Throws std::invalid_argument otherwise.
auto parse_level(const std::string& text) -> Level;

}  // namespace clio
