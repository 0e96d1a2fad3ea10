#include "colored_writer.hpp"

#include <string>
#include <string_view>

namespace clio {

namespace {

auto
ansi_color_code(const Color color) -> std::string_view
{
  switch (color) {
    case Color::Red:
      return "31";
    case Color::Yellow:
      return "33";
    case Color::White:
      return "37";
    case Color::Cyan:
      return "36";
    case Color::Magenta:
      return "35";
    case Color::Default:
      break;
  }
  return {};
}

}  // namespace

AnsiStreamWriter::AnsiStreamWriter(std::ostream& stream, const bool use_color)
    : stream_(stream), use_color_(use_color)
{
}

auto
AnsiStreamWriter::style_sequence(const Style& style) -> std::string
{
  if (style.empty()) {
    return {};
  }
  std::string params;
  if (style.bold) {
    params += '1';
  }
  if (const auto code = ansi_color_code(style.foreground); !code.empty()) {
    if (!params.empty()) {
      params += ';';
    }
    params += code;
  }
  return "\x1b[" + params + "m";
}

void
AnsiStreamWriter::write(const std::string_view text)
{
  stream_ << text;
  check_stream();
}

void
AnsiStreamWriter::set_style(const Style& style)
{
  if (!use_color_) {
    return;
  }
  const auto sequence = style_sequence(style);
  if (!sequence.empty()) {
    stream_ << sequence;
    check_stream();
  }
}

void
AnsiStreamWriter::reset()
{
  if (!use_color_) {
    return;
  }
  stream_ << kResetSequence;
  check_stream();
}

void
AnsiStreamWriter::flush()
{
  stream_.flush();
  check_stream();
}

// A failed stream stays failed until cleared; clear it here so the next
// message gets a fresh attempt and report the failure through failed().
void
AnsiStreamWriter::check_stream()
{
  if (!stream_.good()) {
    failed_ = true;
    stream_.clear();
  }
}

}  // namespace clio
