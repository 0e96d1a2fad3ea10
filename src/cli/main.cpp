#include <csignal>

#include "cli_main.hpp"

auto
main(int argc, char* argv[]) -> int
{
  // A closed pipe on stdout must surface as a write failure, not kill us.
  std::signal(SIGPIPE, SIG_IGN);
  return clio::cli_main(argc, argv);
}
