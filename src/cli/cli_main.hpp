#pragma once

namespace clio {

// Demo entry point: config file first, then the command line, then one
// message per level. Returns the process exit status.
auto cli_main(int argc, char* argv[]) -> int;

}  // namespace clio
