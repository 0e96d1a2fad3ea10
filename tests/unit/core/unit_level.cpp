#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "core/level.hpp"

using namespace clio;

TEST(Level, OrderingFollowsVerbosity)
{
  using enum Level;
  EXPECT_LT(Silent, Error);
  EXPECT_LT(Error, Warn);
  EXPECT_LT(Warn, Status);
  EXPECT_LT(Status, Info);
  EXPECT_LT(Info, Debug);
  EXPECT_LT(Debug, Trace);
  EXPECT_LE(Trace, Trace);
  EXPECT_GE(Status, Warn);
}

struct FilterParam {
  Level threshold;
  Level level;
  bool shown;
};

class ShouldEmit : public ::testing::TestWithParam<FilterParam> {};

TEST_P(ShouldEmit, MatchesThreshold)
{
  const auto& param = GetParam();
  EXPECT_EQ(should_emit(param.threshold, param.level), param.shown);
}

INSTANTIATE_TEST_SUITE_P(
    Level, ShouldEmit,
    ::testing::Values(
        FilterParam{Level::Warn, Level::Error, true},
        FilterParam{Level::Warn, Level::Warn, true},
        FilterParam{Level::Warn, Level::Status, false},
        FilterParam{Level::Warn, Level::Info, false},
        FilterParam{Level::Warn, Level::Debug, false},
        FilterParam{Level::Warn, Level::Trace, false},
        FilterParam{Level::Silent, Level::Error, false},
        FilterParam{Level::Trace, Level::Trace, true},
        FilterParam{Level::Trace, Level::Silent, false},
        FilterParam{Level::Status, Level::Status, true},
        FilterParam{Level::Status, Level::Info, false}));

TEST(Level, VerbosityMapping)
{
  EXPECT_EQ(level_from_verbosity(0), Level::Status);
  EXPECT_EQ(level_from_verbosity(1), Level::Info);
  EXPECT_EQ(level_from_verbosity(2), Level::Debug);
  EXPECT_EQ(level_from_verbosity(3), Level::Trace);
  EXPECT_EQ(level_from_verbosity(100), Level::Trace);
}

TEST(Level, ToString)
{
  EXPECT_EQ(to_string(Level::Silent), "silent");
  EXPECT_EQ(to_string(Level::Warn), "warn");
  EXPECT_EQ(to_string(Level::Trace), "trace");
  EXPECT_EQ(to_string(static_cast<Level>(42)), "unknown");
}

TEST(Level, ParseNamesAndIndices)
{
  EXPECT_EQ(parse_level("error"), Level::Error);
  EXPECT_EQ(parse_level("  DEBUG \n"), Level::Debug);
  EXPECT_EQ(parse_level("Warning"), Level::Warn);
  EXPECT_EQ(parse_level("0"), Level::Silent);
  EXPECT_EQ(parse_level("6"), Level::Trace);
}

TEST(Level, ParseRejectsGarbage)
{
  EXPECT_THROW(parse_level("loud"), std::invalid_argument);
  EXPECT_THROW(parse_level("7"), std::invalid_argument);
  EXPECT_THROW(parse_level(""), std::invalid_argument);
  EXPECT_THROW(parse_level("-1"), std::invalid_argument);
  EXPECT_THROW(parse_level("99999999999999999999999"), std::invalid_argument);
}
