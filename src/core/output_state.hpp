#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "colored_writer.hpp"
#include "level.hpp"

namespace clio {

// A message whose write sequence failed on the underlying stream.
struct WriteFailure {
  Level level;
  std::string message;
};

// =============================================================================
// Process-wide output state
// -----------------------------------------------------------------------------
// At most one state (threshold + writer) is installed at a time. install,
// shutdown and emit all serialize on one mutex, so a message's
// set-style / write / reset sequence is never interleaved with another
// thread's and shutdown never frees a writer that is in use.
// =============================================================================

// Publishes a state. Throws AlreadyInitializedException if one is installed;
// the installed state is left untouched.
void install_state(Level threshold, std::unique_ptr<ColoredWriter> writer);

// Tears the state down. Throws AlreadyShutdownException if none is installed.
void shutdown();

[[nodiscard]] auto is_active() -> bool;

// Threshold of the installed state, std::nullopt when inactive.
[[nodiscard]] auto active_threshold() -> std::optional<Level>;

// Filters `message` against the installed threshold and renders it.
// Calling this with no installed state is a programming error: a fatal
// diagnostic is written to stderr and the process terminates.
void emit(Level level, std::string_view message);

// Returns and clears the last failed write, if any. A closed pipe only shows
// up here when SIGPIPE is ignored; with the default disposition the process
// is killed by the signal before the write returns.
[[nodiscard]] auto take_write_failure() -> std::optional<WriteFailure>;

}  // namespace clio
