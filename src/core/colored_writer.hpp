#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "color_policy.hpp"

namespace clio {

// =============================================================================
// ColoredWriter
// -----------------------------------------------------------------------------
// Destination of the output state. Implementations write raw text and
// switch the foreground style; a writer that was built without colour
// accepts style calls and ignores them.
// =============================================================================
class ColoredWriter {
 public:
  ColoredWriter() = default;
  ColoredWriter(const ColoredWriter&) = delete;
  auto operator=(const ColoredWriter&) -> ColoredWriter& = delete;
  ColoredWriter(ColoredWriter&&) = delete;
  auto operator=(ColoredWriter&&) -> ColoredWriter& = delete;
  virtual ~ColoredWriter() = default;

  virtual void write(std::string_view text) = 0;
  virtual void set_style(const Style& style) = 0;
  virtual void reset() = 0;
  virtual void flush() = 0;

  // Latched once a write failed; cleared by clear_failure().
  [[nodiscard]] virtual auto failed() const -> bool = 0;
  virtual void clear_failure() = 0;

  [[nodiscard]] virtual auto uses_color() const -> bool = 0;
};

// ANSI SGR sequences written to a std::ostream.
class AnsiStreamWriter : public ColoredWriter {
 public:
  AnsiStreamWriter(std::ostream& stream, bool use_color);

  void write(std::string_view text) override;
  void set_style(const Style& style) override;
  void reset() override;
  void flush() override;

  [[nodiscard]] auto failed() const -> bool override { return failed_; }
  void clear_failure() override { failed_ = false; }

  [[nodiscard]] auto uses_color() const -> bool override { return use_color_; }

  [[nodiscard]] static auto style_sequence(const Style& style) -> std::string;
  static constexpr std::string_view kResetSequence = "\x1b[0m";

 private:
  void check_stream();

  std::ostream& stream_;
  bool use_color_;
  bool failed_ = false;
};

}  // namespace clio
