#include <gtest/gtest.h>

#include <iostream>
#include <string>

#include "core/output.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace clio;

TEST(OutputLifecycle, ReconfigureThroughShutdown)
{
  OutputStateGuard guard;
  TerminalProbeGuard probe{true};
  CaptureStream capture{std::cout};

  init().with_verbosity(0).install();
  status("x");
  debug("y");
  shutdown();

  init().with_verbosity(2).install();
  status("x");
  debug("y");
  shutdown();

  EXPECT_EQ(
      capture.str(), expected_line(Level::Status, "x", true) +
                         expected_line(Level::Status, "x", true) +
                         expected_line(Level::Debug, "y", true));
  EXPECT_NE(capture.str().find("\x1b[36my\n"), std::string::npos);
}

TEST(OutputLifecycle, QuietCommandLineFlow)
{
  OutputStateGuard guard;
  CaptureStream capture{std::cout};

  init()
      .with_verbosity(3)
      .with_quiet(true)
      .with_silent(false)
      .with_color_mode(ColorMode::Never)
      .install();
  error("failed: {}", "disk full");
  warn("retrying");
  status("copying");

  shutdown();
  EXPECT_THROW(shutdown(), AlreadyShutdownException);
  EXPECT_EQ(capture.str(), "failed: disk full\n");
}
