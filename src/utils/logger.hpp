#pragma once

#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace clio {
// Library diagnostics
// -------------------
// Problems detected by clio itself (bad configuration, bad command-line
// options, misuse of the output state) are reported on stderr. These lines
// never go through the user-facing output state, so they work before
// install() and after shutdown().

inline std::mutex diagnostics_mutex;

inline constexpr std::string_view kDiagnosticsPrefix = "[clio] ";

// =============================================================================
// Line formatting shared by all diagnostic severities
// =============================================================================

inline auto
diagnostic_line(std::string_view severity, std::string_view message)
    -> std::string
{
  std::string line{kDiagnosticsPrefix};
  line += severity;
  line += ": ";
  line += message;
  line += '\n';
  return line;
}

inline void
write_diagnostic(std::string_view severity, std::string_view message)
{
  const auto line = diagnostic_line(severity, message);
  const std::scoped_lock lock(diagnostics_mutex);
  std::cerr << line << std::flush;
}

// =============================================================================
// Unconditional stderr logging
// =============================================================================

inline void
log_warning(const std::string& message)
{
  write_diagnostic("WARNING", message);
}

inline void
log_error(const std::string& message)
{
  write_diagnostic("ERROR", message);
}

[[noreturn]] inline void
log_fatal(const std::string& message)
{
  write_diagnostic("FATAL", message);
  std::terminate();
}
}  // namespace clio
