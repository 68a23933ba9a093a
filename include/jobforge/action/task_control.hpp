#pragma once

#include "jobforge/core/coroutine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace jobforge {

enum class ControlState : std::uint8_t { Run, Pause, Stop };

// Cooperative cancellation token shared by the supervisor (writer) and the
// chain running on a worker shard (reader).
class TaskControl {
public:
  /// Run -> Pause. False when the task is not running.
  auto pause() noexcept -> bool {
    auto expected = ControlState::Run;
    return state_.compare_exchange_strong(expected, ControlState::Pause,
                                          std::memory_order_acq_rel);
  }

  /// Pause -> Run. False when the task is not paused.
  auto resume() noexcept -> bool {
    auto expected = ControlState::Pause;
    return state_.compare_exchange_strong(expected, ControlState::Run,
                                          std::memory_order_acq_rel);
  }

  auto stop() noexcept -> void {
    state_.store(ControlState::Stop, std::memory_order_release);
  }

  [[nodiscard]] auto state() const noexcept -> ControlState {
    return state_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return state() == ControlState::Stop;
  }
  [[nodiscard]] auto paused() const noexcept -> bool {
    return state() == ControlState::Pause;
  }

  /// Suspends while paused. Returns false once a stop has been requested.
  auto checkpoint(std::chrono::milliseconds poll = std::chrono::milliseconds(
                      20)) const -> task<bool> {
    while (paused()) {
      if (!co_await async_sleep(poll)) {
        co_return false;
      }
    }
    co_return !stop_requested();
  }

private:
  std::atomic<ControlState> state_{ControlState::Run};
};

} // namespace jobforge
