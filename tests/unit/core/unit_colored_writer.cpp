#include <gtest/gtest.h>

#include <ostream>
#include <sstream>

#include "core/colored_writer.hpp"
#include "test_helpers.hpp"

using namespace clio;

TEST(AnsiStreamWriter, StyleSequences)
{
  EXPECT_EQ(
      AnsiStreamWriter::style_sequence({Color::Red, true}), "\x1b[1;31m");
  EXPECT_EQ(
      AnsiStreamWriter::style_sequence({Color::Yellow, true}), "\x1b[1;33m");
  EXPECT_EQ(
      AnsiStreamWriter::style_sequence({Color::White, false}), "\x1b[37m");
  EXPECT_EQ(AnsiStreamWriter::style_sequence({Color::Cyan, false}), "\x1b[36m");
  EXPECT_EQ(
      AnsiStreamWriter::style_sequence({Color::Magenta, false}), "\x1b[35m");
  EXPECT_EQ(
      AnsiStreamWriter::style_sequence({Color::Default, true}), "\x1b[1m");
  EXPECT_EQ(AnsiStreamWriter::style_sequence({}), "");
}

TEST(AnsiStreamWriter, PlainWriterIgnoresStyles)
{
  std::ostringstream out;
  AnsiStreamWriter writer{out, false};
  writer.set_style({Color::Red, true});
  writer.write("plain");
  writer.reset();
  EXPECT_EQ(out.str(), "plain");
  EXPECT_FALSE(writer.uses_color());
}

TEST(AnsiStreamWriter, ColorWriterEmitsSequences)
{
  std::ostringstream out;
  AnsiStreamWriter writer{out, true};
  writer.set_style({Color::Cyan, false});
  writer.write("x");
  writer.reset();
  EXPECT_EQ(out.str(), "\x1b[36mx\x1b[0m");
}

TEST(AnsiStreamWriter, EmptyStyleStillResets)
{
  std::ostringstream out;
  AnsiStreamWriter writer{out, true};
  writer.set_style({});
  writer.write("status");
  writer.reset();
  EXPECT_EQ(out.str(), "status\x1b[0m");
}

TEST(AnsiStreamWriter, FailureIsLatchedAndStreamRecovers)
{
  FailingStreambuf failing;
  std::ostream out{&failing};
  AnsiStreamWriter writer{out, false};
  writer.write("lost");
  EXPECT_TRUE(writer.failed());
  EXPECT_TRUE(out.good());
  writer.clear_failure();
  EXPECT_FALSE(writer.failed());
}
