#pragma once

#include "folio/time/i_time_provider.hpp"

namespace folio {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the server executable. std::chrono::system_clock::now() is safe to
// call from any thread, so no internal synchronization is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace folio
