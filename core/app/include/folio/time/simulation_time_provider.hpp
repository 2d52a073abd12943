#pragma once

#include "folio/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace folio {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly instead of read from
//         the system clock.
//
// @details
// Paired with SimulatedFillScheduler this makes fill latency fully
// deterministic: a test submits an order, advances the clock past the fill
// delay, and calls runDue(). No sleeps, no wall-clock races.
//
// Internal storage is a std::atomic<int64_t>; readers on any thread see the
// latest store without a mutex.
//
// Thread model:
//   advance_time()/advance_by() are intended for a single writer (the test
//   or harness). now_ms() may be called from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // Sets the clock to an absolute epoch millisecond value. Monotonicity is
  // the caller's responsibility; tests occasionally set arbitrary times.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms (may be zero).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace folio
