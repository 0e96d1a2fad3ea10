#include "output_state.hpp"

#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "color_policy.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace clio {

namespace {

struct OutputState {
  Level threshold;
  std::unique_ptr<ColoredWriter> writer;
  std::optional<WriteFailure> last_failure;
};

struct Registry {
  std::mutex mutex;
  std::optional<OutputState> slot;
};

auto
registry() -> Registry&
{
  static Registry instance;
  return instance;
}

void
render(OutputState& state, const Level level, const std::string_view message)
{
  auto& writer = *state.writer;
  writer.clear_failure();
  writer.set_style(level_style(level));
  writer.write(message);
  writer.write("\n");
  writer.reset();
  writer.flush();
  if (writer.failed()) {
    state.last_failure = WriteFailure{level, std::string{message}};
    writer.clear_failure();
  }
}

}  // namespace

void
install_state(const Level threshold, std::unique_ptr<ColoredWriter> writer)
{
  if (!writer) {
    throw std::invalid_argument("clio output state requires a writer");
  }
  auto& reg = registry();
  const std::scoped_lock lock(reg.mutex);
  if (reg.slot.has_value()) {
    throw AlreadyInitializedException();
  }
  reg.slot.emplace(OutputState{threshold, std::move(writer), std::nullopt});
}

void
shutdown()
{
  auto& reg = registry();
  const std::scoped_lock lock(reg.mutex);
  if (!reg.slot.has_value()) {
    throw AlreadyShutdownException();
  }
  reg.slot->writer->flush();
  reg.slot.reset();
}

auto
is_active() -> bool
{
  auto& reg = registry();
  const std::scoped_lock lock(reg.mutex);
  return reg.slot.has_value();
}

auto
active_threshold() -> std::optional<Level>
{
  auto& reg = registry();
  const std::scoped_lock lock(reg.mutex);
  if (!reg.slot.has_value()) {
    return std::nullopt;
  }
  return reg.slot->threshold;
}

// =============================================================================
// Emit pipeline: filter on the threshold, then render under the lock
// =============================================================================

void
emit(const Level level, const std::string_view message)
{
  auto& reg = registry();
  const std::scoped_lock lock(reg.mutex);
  if (!reg.slot.has_value()) {
    log_fatal(std::format(
        "attempt to emit a {} message before the output state was installed",
        to_string(level)));
  }
  if (!should_emit(reg.slot->threshold, level)) {
    return;
  }
  render(*reg.slot, level, message);
}

auto
take_write_failure() -> std::optional<WriteFailure>
{
  auto& reg = registry();
  const std::scoped_lock lock(reg.mutex);
  if (!reg.slot.has_value()) {
    return std::nullopt;
  }
  return std::exchange(reg.slot->last_failure, std::nullopt);
}

}  // namespace clio
