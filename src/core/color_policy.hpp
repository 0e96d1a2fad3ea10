#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "level.hpp"

namespace clio {

// User intent for colouring output.
enum class ColorMode : std::uint8_t { Never, Always, AutoDetect };

enum class Color : std::uint8_t { Default, Red, Yellow, White, Cyan, Magenta };

struct Style {
  Color foreground = Color::Default;
  bool bold = false;

  [[nodiscard]] auto empty() const noexcept -> bool
  {
    return foreground == Color::Default && !bold;
  }

  friend auto operator==(const Style&, const Style&) -> bool = default;
};

// =============================================================================
// Colour decision
// -----------------------------------------------------------------------------
// Never and Always ignore the terminal entirely. AutoDetect colours only
// when stdout is an interactive terminal. The decision is taken once, when
// the output state is installed.
// =============================================================================
[[nodiscard]] constexpr auto
resolve_color(const ColorMode mode, const bool is_terminal) noexcept -> bool
{
  switch (mode) {
    case ColorMode::Never:
      return false;
    case ColorMode::Always:
      return true;
    case ColorMode::AutoDetect:
      return is_terminal;
  }
  return false;
}

// False when the environment opts out of colour: NO_COLOR set to a
// non-empty value, or TERM=dumb.
[[nodiscard]] auto environment_allows_color() -> bool;

// True when stdout is a tty and environment_allows_color() holds.
[[nodiscard]] auto stdout_is_terminal() -> bool;

using TerminalProbe = std::function<bool()>;
void set_terminal_probe_override(TerminalProbe probe);
void reset_terminal_probe_override();

[[nodiscard]] auto level_style(Level level) noexcept -> Style;

auto parse_color_mode(const std::string& text) -> ColorMode;

[[nodiscard]] auto to_string(ColorMode mode) -> std::string_view;

}  // namespace clio
