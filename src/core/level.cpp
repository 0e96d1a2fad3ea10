#include "level.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "utils/text_utils.hpp"

namespace clio {

namespace {

constexpr std::array<std::string_view, 7> kLevelNames{
    "silent", "error", "warn", "status", "info", "debug", "trace"};

}  // namespace

auto
to_string(const Level level) -> std::string_view
{
  const auto index = std::to_underlying(level);
  if (index >= kLevelNames.size()) {
    return "unknown";
  }
  return kLevelNames[index];
}

// =============================================================================
// Parse a level from its name or its numeric index
// =============================================================================

auto
parse_level(const std::string& text) -> Level
{
  const std::string trimmed = trim(text);

  if (is_all_digits(trimmed)) {
    unsigned long index{};
    try {
      index = std::stoul(trimmed);
    }
    catch (const std::out_of_range&) {
      throw std::invalid_argument("Level index out of range: " + trimmed);
    }
    if (index >= kLevelNames.size()) {
      throw std::invalid_argument("Invalid level: " + trimmed);
    }
    return static_cast<Level>(index);
  }

  const std::string lower = to_lower(trimmed);
  if (lower == "warning") {
    return Level::Warn;
  }
  for (std::size_t idx = 0; idx < kLevelNames.size(); ++idx) {
    if (kLevelNames[idx] == lower) {
      return static_cast<Level>(idx);
    }
  }
  throw std::invalid_argument("Invalid level: " + trimmed);
}

}  // namespace clio
