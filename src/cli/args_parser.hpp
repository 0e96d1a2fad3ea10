#pragma once
#include <span>
#include <string>

#include "utils/config_loader.hpp"

namespace clio {

inline auto
get_help_message(const char* prog_name) -> std::string
{
  std::string msg = "Usage: ";
  msg += prog_name;
  msg +=
      " [OPTIONS]\n"
      "\nOptions:\n"
      "  -v, -vv, -vvv           Increase verbosity (info, debug, trace)\n"
      "  --verbose N             Verbosity count (0=status ... 3+=trace)\n"
      "  --level NAME            Threshold by name (silent, error, warn,\n"
      "                          status, info, debug, trace)\n"
      "  -q, --quiet             Only show errors\n"
      "  -s, --silent            Show nothing, not even errors\n"
      "  --color MODE            never, always or auto (default: auto)\n"
      "  -c, --config [file]     YAML configuration file\n"
      "  -h, --help              Show this help message\n";
  return msg;
}

// Parses argv (including the program name) on top of `opts`, so that
// values loaded from a config file are overridden by the command line.
auto parse_arguments(std::span<char*> args_span, OutputConfig opts = {})
    -> OutputConfig;

}  // namespace clio
