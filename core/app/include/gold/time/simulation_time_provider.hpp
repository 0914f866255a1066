#pragma once

#include "gold/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace gold {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set explicitly.
//
// @details
// Used by tests and by replay tooling: the caller sets the time with
// advance_time() and every event committed afterwards carries exactly that
// timestamp. The value is not required to be monotonic.
//
// std::atomic keeps now_ms() safe while another thread advances the clock.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace gold
