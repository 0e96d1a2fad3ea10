#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace clio {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

inline auto
trim(std::string_view val) -> std::string
{
  const auto first = val.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = val.find_last_not_of(kWhitespace);
  return std::string{val.substr(first, last - first + 1)};
}

inline auto
to_lower(std::string_view val) -> std::string
{
  std::string lower(val.size(), '\0');
  std::transform(val.begin(), val.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower;
}

inline auto
is_all_digits(std::string_view val) -> bool
{
  return !val.empty() &&
         std::all_of(val.begin(), val.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

}  // namespace clio
