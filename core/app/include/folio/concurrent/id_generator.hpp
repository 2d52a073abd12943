#pragma once

#include <atomic>
#include <cstdint>

namespace folio {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids via an atomic counter. Each call to next_id()
//         returns a value different from every other call on the same
//         instance, whichever thread makes it.
//
// @details
// Starts at 1; 0 is reserved as the "unset" sentinel. The engine owns one
// generator per id space (orders, transactions, audit events) as value
// members and injects them by reference.
//
// std::memory_order_relaxed is enough: the only requirement is uniqueness,
// not ordering against other memory operations.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  // Copying would create two sources handing out the same ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace folio
