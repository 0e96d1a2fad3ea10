#pragma once

#include <gtest/gtest.h>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

#include "core/color_policy.hpp"
#include "core/colored_writer.hpp"
#include "core/output_state.hpp"

namespace clio {

class CaptureStream {
 public:
  explicit CaptureStream(std::ostream& stream)
      : stream_{stream}, old_buf_{stream.rdbuf(buffer_.rdbuf())}
  {
  }
  CaptureStream(const CaptureStream&) = delete;
  auto operator=(const CaptureStream&) -> CaptureStream& = delete;
  ~CaptureStream() { stream_.rdbuf(old_buf_); }
  [[nodiscard]] auto str() const -> std::string { return buffer_.str(); }

 private:
  std::ostream& stream_;
  std::ostringstream buffer_;
  std::streambuf* old_buf_;
};

// Leaves the process without an installed output state, before and after
// the test, whatever the test did in between.
class OutputStateGuard {
 public:
  OutputStateGuard() { release(); }
  OutputStateGuard(const OutputStateGuard&) = delete;
  auto operator=(const OutputStateGuard&) -> OutputStateGuard& = delete;
  ~OutputStateGuard() { release(); }

 private:
  static void release()
  {
    if (is_active()) {
      shutdown();
    }
  }
};

struct TerminalProbeGuard {
  explicit TerminalProbeGuard(bool is_terminal)
  {
    set_terminal_probe_override([is_terminal] { return is_terminal; });
  }
  TerminalProbeGuard(const TerminalProbeGuard&) = delete;
  auto operator=(const TerminalProbeGuard&) -> TerminalProbeGuard& = delete;
  ~TerminalProbeGuard() { reset_terminal_probe_override(); }
};

// Owns mutable copies of the arguments so they can be handed out as char*.
class ArgvBuilder {
 public:
  ArgvBuilder(std::initializer_list<std::string> args) : storage_(args)
  {
    pointers_.reserve(storage_.size());
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
  }

  auto span() -> std::span<char*> { return pointers_; }
  [[nodiscard]] auto argc() const -> int
  {
    return static_cast<int>(pointers_.size());
  }
  auto argv() -> char** { return pointers_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

// Sets or unsets one environment variable and restores the previous value
// on destruction.
class EnvVarGuard {
 public:
  EnvVarGuard(std::string name, const char* value) : name_{std::move(name)}
  {
    if (const char* previous = std::getenv(name_.c_str()); previous != nullptr) {
      previous_ = previous;
    }
    apply(value);
  }
  EnvVarGuard(const EnvVarGuard&) = delete;
  auto operator=(const EnvVarGuard&) -> EnvVarGuard& = delete;
  ~EnvVarGuard() { apply(previous_ ? previous_->c_str() : nullptr); }

 private:
  void apply(const char* value) const
  {
    if (value == nullptr) {
      unsetenv(name_.c_str());
    } else {
      setenv(name_.c_str(), value, 1);
    }
  }

  std::string name_;
  std::optional<std::string> previous_;
};

// A stream buffer that rejects every character, as a closed pipe would.
class FailingStreambuf : public std::streambuf {
 protected:
  auto overflow(int_type /*ch*/) -> int_type override
  {
    return traits_type::eof();
  }
};

inline auto
expected_line(Level level, const std::string& msg, bool colored)
    -> std::string
{
  if (!colored) {
    return msg + "\n";
  }
  return AnsiStreamWriter::style_sequence(level_style(level)) + msg + "\n" +
         std::string(AnsiStreamWriter::kResetSequence);
}

}  // namespace clio
