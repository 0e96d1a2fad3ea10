#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "logger.hpp"

namespace clio {

namespace {

constexpr std::array<std::string_view, 5> kAllowedKeys{
    "level", "verbosity", "quiet", "silent", "color"};

struct PostParseHookState {
  std::mutex mutex;
  ConfigLoaderPostParseHook hook;
};

auto
post_parse_hook_state() -> PostParseHookState&
{
  static PostParseHookState instance;
  return instance;
}

void
run_post_parse_hook(OutputConfig& cfg)
{
  ConfigLoaderPostParseHook hook;
  {
    auto& state = post_parse_hook_state();
    const std::scoped_lock lock(state.mutex);
    hook = state.hook;
  }
  if (hook) {
    hook(cfg);
  }
}

auto
validate_allowed_keys(const YAML::Node& root, OutputConfig& cfg) -> bool
{
  for (const auto& kvalue : root) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (std::ranges::find(kAllowedKeys, std::string_view{key}) ==
        kAllowedKeys.end()) {
      log_error(std::string("Unknown configuration option: ") + key);
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

void
parse_threshold_nodes(const YAML::Node& root, OutputConfig& cfg)
{
  if (root["level"] && root["verbosity"]) {
    log_error("level and verbosity are mutually exclusive");
    cfg.valid = false;
    return;
  }
  if (root["level"]) {
    cfg.level = parse_level(root["level"].as<std::string>());
  }
  if (root["verbosity"]) {
    const int verbosity = root["verbosity"].as<int>();
    if (verbosity < 0) {
      throw std::invalid_argument("verbosity must be >= 0");
    }
    cfg.verbosity = static_cast<unsigned>(verbosity);
  }
}

void
parse_flag_nodes(const YAML::Node& root, OutputConfig& cfg)
{
  if (root["quiet"]) {
    cfg.quiet = root["quiet"].as<bool>();
  }
  if (root["silent"]) {
    cfg.silent = root["silent"].as<bool>();
  }
  if (root["color"]) {
    cfg.color = parse_color_mode(root["color"].as<std::string>());
  }
}

}  // namespace

void
set_config_loader_post_parse_hook(ConfigLoaderPostParseHook hook)
{
  auto& state = post_parse_hook_state();
  const std::scoped_lock lock(state.mutex);
  state.hook = std::move(hook);
}

void
reset_config_loader_post_parse_hook()
{
  set_config_loader_post_parse_hook({});
}

// =============================================================================
// Top-level entry: parse a YAML file into an OutputConfig
// =============================================================================

auto
load_config(const std::string& path) -> OutputConfig
{
  OutputConfig cfg;
  cfg.config_path = path;
  const auto mark_invalid = [&cfg](const std::string& message) {
    log_error(std::string("Failed to load config: ") + message);
    cfg.valid = false;
  };
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (root.IsNull()) {
      run_post_parse_hook(cfg);
      return cfg;
    }
    if (!root.IsMap()) {
      log_error("Config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    if (!validate_allowed_keys(root, cfg)) {
      return cfg;
    }
    parse_threshold_nodes(root, cfg);
    parse_flag_nodes(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }

  if (cfg.valid) {
    run_post_parse_hook(cfg);
  }
  return cfg;
}

}  // namespace clio
