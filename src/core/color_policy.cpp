#include "color_policy.hpp"

#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "utils/text_utils.hpp"

namespace clio {

namespace {

struct ProbeState {
  std::mutex mutex;
  TerminalProbe override_probe;
};

auto
probe_state() -> ProbeState&
{
  static ProbeState instance;
  return instance;
}

}  // namespace

auto
environment_allows_color() -> bool
{
  if (const char* no_color = std::getenv("NO_COLOR");
      no_color != nullptr && *no_color != '\0') {
    return false;
  }
  const char* term = std::getenv("TERM");
  return term == nullptr || std::string_view{term} != "dumb";
}

auto
stdout_is_terminal() -> bool
{
  TerminalProbe probe;
  {
    auto& state = probe_state();
    const std::scoped_lock lock(state.mutex);
    probe = state.override_probe;
  }
  if (probe) {
    return probe();
  }
  if (isatty(STDOUT_FILENO) == 0) {
    return false;
  }
  return environment_allows_color();
}

void
set_terminal_probe_override(TerminalProbe probe)
{
  auto& state = probe_state();
  const std::scoped_lock lock(state.mutex);
  state.override_probe = std::move(probe);
}

void
reset_terminal_probe_override()
{
  set_terminal_probe_override({});
}

// =============================================================================
// Per-level styling
// =============================================================================

auto
level_style(const Level level) noexcept -> Style
{
  using enum Level;
  switch (level) {
    case Error:
      return {Color::Red, true};
    case Warn:
      return {Color::Yellow, true};
    case Info:
      return {Color::White, false};
    case Debug:
      return {Color::Cyan, false};
    case Trace:
      return {Color::Magenta, false};
    default:
      return {};
  }
}

auto
parse_color_mode(const std::string& text) -> ColorMode
{
  const std::string lower = to_lower(trim(text));
  if (lower == "never") {
    return ColorMode::Never;
  }
  if (lower == "always") {
    return ColorMode::Always;
  }
  if (lower == "auto" || lower == "auto-detect" || lower == "autodetect") {
    return ColorMode::AutoDetect;
  }
  throw std::invalid_argument("Invalid color mode: " + trim(text));
}

auto
to_string(const ColorMode mode) -> std::string_view
{
  switch (mode) {
    case ColorMode::Never:
      return "never";
    case ColorMode::Always:
      return "always";
    case ColorMode::AutoDetect:
      return "auto";
  }
  return "unknown";
}

}  // namespace clio
