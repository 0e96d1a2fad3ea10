#include "output_builder.hpp"

#include <iostream>
#include <memory>
#include <ostream>

#include "colored_writer.hpp"
#include "output_state.hpp"
#include "utils/config_loader.hpp"

namespace clio {

auto
OutputBuilder::with_level(const Level level) const -> OutputBuilder
{
  auto next = *this;
  next.level_ = level;
  return next;
}

auto
OutputBuilder::with_verbosity(const unsigned verbosity) const -> OutputBuilder
{
  return with_level(level_from_verbosity(verbosity));
}

auto
OutputBuilder::with_quiet(const bool quiet) const -> OutputBuilder
{
  return quiet ? with_level(Level::Error) : *this;
}

auto
OutputBuilder::with_silent(const bool silent) const -> OutputBuilder
{
  return silent ? with_level(Level::Silent) : *this;
}

auto
OutputBuilder::with_color_mode(const ColorMode mode) const -> OutputBuilder
{
  auto next = *this;
  next.color_mode_ = mode;
  return next;
}

auto
OutputBuilder::with_config(const OutputConfig& config) const -> OutputBuilder
{
  auto next = *this;
  if (config.level) {
    next = next.with_level(*config.level);
  } else if (config.verbosity) {
    next = next.with_verbosity(*config.verbosity);
  }
  if (config.color) {
    next = next.with_color_mode(*config.color);
  }
  return next.with_quiet(config.quiet).with_silent(config.silent);
}

void
OutputBuilder::install() const
{
  install_to(std::cout);
}

void
OutputBuilder::install_to(std::ostream& stream) const
{
  const bool is_terminal = color_mode_ == ColorMode::AutoDetect &&
                           &stream == &std::cout && stdout_is_terminal();
  const bool use_color = resolve_color(color_mode_, is_terminal);
  install_state(level_, std::make_unique<AnsiStreamWriter>(stream, use_color));
}

}  // namespace clio
