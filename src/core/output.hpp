#pragma once

#include <format>
#include <string>
#include <utility>

#include "level.hpp"
#include "output_builder.hpp"
#include "output_state.hpp"

namespace clio {

// =============================================================================
// Leveled output
// -----------------------------------------------------------------------------
// Each call formats its arguments with std::format and hands the text to
// emit(). Messages above the installed threshold are dropped before
// formatting. All of these terminate the process when called before
// install().
// =============================================================================

template <typename... Args>
void
emit_formatted(
    const Level level, std::format_string<Args...> fmt, Args&&... args)
{
  if (const auto threshold = active_threshold();
      threshold && !should_emit(*threshold, level)) {
    return;
  }
  emit(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void
error(std::format_string<Args...> fmt, Args&&... args)
{
  emit_formatted(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void
warn(std::format_string<Args...> fmt, Args&&... args)
{
  emit_formatted(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void
status(std::format_string<Args...> fmt, Args&&... args)
{
  emit_formatted(Level::Status, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void
info(std::format_string<Args...> fmt, Args&&... args)
{
  emit_formatted(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void
debug(std::format_string<Args...> fmt, Args&&... args)
{
  emit_formatted(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void
trace(std::format_string<Args...> fmt, Args&&... args)
{
  emit_formatted(Level::Trace, fmt, std::forward<Args>(args)...);
}

}  // namespace clio
