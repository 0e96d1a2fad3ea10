#pragma once
#include <functional>
#include <optional>
#include <string>

#include "core/color_policy.hpp"
#include "core/level.hpp"

namespace clio {

// =============================================================================
// OutputConfig
// -----------------------------------------------------------------------------
// Output settings read from a YAML file or from the command line. Unset
// optionals leave the builder defaults in place.
// =============================================================================
struct OutputConfig {
  std::optional<Level> level;
  std::optional<unsigned> verbosity;
  bool quiet = false;
  bool silent = false;
  std::optional<ColorMode> color;
  std::string config_path;
  bool show_help = false;
  bool valid = true;
};

// Never throws: a missing file, malformed YAML or an invalid setting is
// reported on stderr and clears `valid`.
auto load_config(const std::string& path) -> OutputConfig;

using ConfigLoaderPostParseHook = std::function<void(OutputConfig&)>;
void set_config_loader_post_parse_hook(ConfigLoaderPostParseHook hook);
void reset_config_loader_post_parse_hook();

}  // namespace clio
