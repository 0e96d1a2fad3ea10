#include "cli_main.hpp"

#include <cstddef>
#include <format>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include "args_parser.hpp"
#include "core/output.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace clio {

namespace {

auto
find_config_path(std::span<char*> args_without_program) -> std::string
{
  for (auto it = args_without_program.begin(); it != args_without_program.end();
       ++it) {
    std::string_view arg(*it);
    if (arg == "--config" || arg == "-c") {
      if (auto value_it = std::next(it);
          value_it != args_without_program.end()) {
        return *value_it;
      }
      break;
    }
  }
  return {};
}

void
emit_demo_messages()
{
  error("an error: {}", 1);
  warn("a warning: {}", 1 + 1);
  status("a normal message");
  info("useful info");
  debug("debug info");
  trace("tracing");
}

}  // namespace

auto
cli_main(int argc, char* argv[]) -> int
{
  std::span<char*> args_span(argv, static_cast<std::size_t>(argc));
  if (args_span.empty()) {
    log_error("Missing program name in argument vector.");
    return 1;
  }

  OutputConfig opts;
  if (const auto config_path = find_config_path(args_span.subspan(1));
      !config_path.empty()) {
    opts = load_config(config_path);
    if (!opts.valid) {
      log_error("Invalid configuration file: " + config_path);
      return 1;
    }
  }

  opts = parse_arguments(args_span, opts);

  if (opts.show_help) {
    std::cout << get_help_message(args_span.front());
    return 0;
  }

  if (!opts.valid) {
    log_error("Invalid program options.");
    return 1;
  }

  try {
    init().with_config(opts).install();
  }
  catch (const AlreadyInitializedException& e) {
    log_fatal(e.what());
  }

  emit_demo_messages();

  if (const auto failure = take_write_failure()) {
    log_warning(std::format(
        "failed to write {} message to stdout: {}", to_string(failure->level),
        failure->message));
  }

  try {
    shutdown();
  }
  catch (const AlreadyShutdownException& e) {
    log_warning(e.what());
  }
  return 0;
}

}  // namespace clio
