#include "args_parser.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "core/color_policy.hpp"
#include "core/level.hpp"
#include "utils/logger.hpp"

namespace clio {

namespace {

auto
missing_value_error(std::string_view option_name) -> bool
{
  log_error(std::format("{} option requires a value.", option_name));
  return false;
}

template <typename Func>
auto
try_parse(const char* val, Func&& parser) -> bool
{
  try {
    std::forward<Func>(parser)(val);
    return true;
  }
  catch (const std::invalid_argument& e) {
    log_error(e.what());
  }
  catch (const std::out_of_range& e) {
    log_error(e.what());
  }
  return false;
}

template <typename Func>
auto
expect_and_parse(
    std::string_view option_name, std::size_t& idx, std::span<char*> args,
    Func&& parser) -> bool
{
  if (idx + 1 >= args.size()) {
    return missing_value_error(option_name);
  }
  ++idx;
  return try_parse(args[idx], std::forward<Func>(parser));
}

// "-v", "-vv", "-vvv", ... ; returns the number of v's or 0.
auto
count_verbose_flags(std::string_view arg) -> unsigned
{
  if (arg.size() < 2 || arg.front() != '-' || arg[1] == '-') {
    return 0;
  }
  const auto flags = arg.substr(1);
  if (!std::ranges::all_of(flags, [](char c) { return c == 'v'; })) {
    return 0;
  }
  return static_cast<unsigned>(flags.size());
}

// =============================================================================
// Individual argument parsers
// =============================================================================

auto
parse_verbose(OutputConfig& opts, std::size_t& idx, std::span<char*> args)
    -> bool
{
  return expect_and_parse("--verbose", idx, args, [&opts](const char* val) {
    const auto count = std::stoi(val);
    if (count < 0) {
      throw std::invalid_argument("--verbose must be >= 0.");
    }
    opts.verbosity = static_cast<unsigned>(count);
    opts.level.reset();
  });
}

auto
parse_level_option(OutputConfig& opts, std::size_t& idx, std::span<char*> args)
    -> bool
{
  return expect_and_parse("--level", idx, args, [&opts](const char* val) {
    opts.level = parse_level(val);
    opts.verbosity.reset();
  });
}

auto
parse_color(OutputConfig& opts, std::size_t& idx, std::span<char*> args)
    -> bool
{
  return expect_and_parse("--color", idx, args, [&opts](const char* val) {
    opts.color = parse_color_mode(val);
  });
}

auto
parse_config(OutputConfig& opts, std::size_t& idx, std::span<char*> args)
    -> bool
{
  if (idx + 1 >= args.size()) {
    return missing_value_error("--config");
  }
  ++idx;
  opts.config_path = args[idx];
  if (!std::filesystem::exists(opts.config_path)) {
    log_error(std::format("Config file not found: {}", opts.config_path));
    return false;
  }
  return true;
}

// =============================================================================
// Dispatch argument parser (main parser loop)
// =============================================================================

auto
parse_argument_values(std::span<char*> args_span, OutputConfig& opts) -> bool
{
  using Parser = bool (*)(OutputConfig&, std::size_t&, std::span<char*>);
  const static std::unordered_map<std::string_view, Parser> dispatch = {
      {"--verbose", parse_verbose}, {"--level", parse_level_option},
      {"--color", parse_color},     {"--config", parse_config},
      {"-c", parse_config},
  };

  unsigned verbose_flags = 0;
  for (std::size_t idx = 1; idx < args_span.size(); ++idx) {
    const std::string_view arg = args_span[idx];

    if (const auto count = count_verbose_flags(arg); count > 0) {
      verbose_flags += count;
    } else if (arg == "--quiet" || arg == "-q") {
      opts.quiet = true;
    } else if (arg == "--silent" || arg == "-s") {
      opts.silent = true;
    } else if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
      return true;
    } else if (auto iter = dispatch.find(arg); iter != dispatch.end()) {
      if (!iter->second(opts, idx, args_span)) {
        return false;
      }
    } else {
      log_error(std::format(
          "Unknown argument: {}. Use --help to see valid options.", arg));
      return false;
    }
  }

  if (verbose_flags > 0) {
    opts.verbosity = verbose_flags;
    opts.level.reset();
  }
  return true;
}

}  // namespace

// =============================================================================
// Top-level entry: parses all arguments into an OutputConfig
// =============================================================================

auto
parse_arguments(std::span<char*> args_span, OutputConfig opts) -> OutputConfig
{
  if (!parse_argument_values(args_span, opts)) {
    opts.valid = false;
  }
  return opts;
}

}  // namespace clio
