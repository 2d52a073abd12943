#pragma once

#include <cstdint>

namespace folio {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Order timestamps, fill due times and risk-profile staleness all read the
// clock. If components called system_clock directly, tests of the fill
// delay or the 180-day staleness rule would depend on wall-clock time.
// Components therefore receive `const ITimeProvider&`:
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value the test or harness sets.
//
// Why int64_t milliseconds instead of std::chrono::time_point:
//   The same values are written into JSON (IPC responses, audit details,
//   configuration) where a plain integer needs no conversion.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

// Milliseconds in one day, for staleness arithmetic.
inline constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

}  // namespace folio
