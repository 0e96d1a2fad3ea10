#pragma once

#include <ostream>

#include "color_policy.hpp"
#include "level.hpp"

namespace clio {

struct OutputConfig;

// =============================================================================
// OutputBuilder
// -----------------------------------------------------------------------------
// Accumulates output settings and installs them as the process-wide output
// state. Every setter is last-write-wins on the threshold, except that
// with_quiet(false) and with_silent(false) leave it alone. Apply them in
// the order verbosity, quiet, silent so that the flags override -v.
// =============================================================================
class OutputBuilder {
 public:
  OutputBuilder() = default;

  [[nodiscard]] auto with_level(Level level) const -> OutputBuilder;
  [[nodiscard]] auto with_verbosity(unsigned verbosity) const -> OutputBuilder;
  [[nodiscard]] auto with_quiet(bool quiet) const -> OutputBuilder;
  [[nodiscard]] auto with_silent(bool silent) const -> OutputBuilder;
  [[nodiscard]] auto with_color_mode(ColorMode mode) const -> OutputBuilder;
  [[nodiscard]] auto with_config(const OutputConfig& config) const
      -> OutputBuilder;

  [[nodiscard]] auto level() const noexcept -> Level { return level_; }
  [[nodiscard]] auto color_mode() const noexcept -> ColorMode
  {
    return color_mode_;
  }

  // Resolves the colour mode and installs a writer bound to std::cout.
  // Throws AlreadyInitializedException if a state is already installed.
  void install() const;

  // Same as install() but writes to `stream`. AutoDetect only consults the
  // terminal when `stream` is std::cout; any other stream is plain.
  void install_to(std::ostream& stream) const;

 private:
  Level level_ = kDefaultLevel;
  ColorMode color_mode_ = ColorMode::AutoDetect;
};

// Entry point: a builder with the defaults (Status, AutoDetect).
[[nodiscard]] inline auto
init() -> OutputBuilder
{
  return OutputBuilder{};
}

}  // namespace clio
