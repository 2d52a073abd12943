#pragma once

#include "folio/domain/instrument.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// InstrumentCatalog — lookup of tradable instruments
// -----------------------------------------------------------------------------
//
// @brief  Keyed store of Instrument records. Read-only from the point of
//         view of the order engine; prices are refreshed and instruments
//         delisted by the surrounding application.
//
// @details
// Every accessor returns copies. A caller that resolved an instrument at
// submission time holds its own snapshot; OrderEngine re-resolves at fill
// time and treats a missing instrument as a failed order.
//
// Thread model:
//   std::shared_mutex: concurrent find()/all() from the submission and fill
//   threads, exclusive access for add()/updatePrice()/remove().
//
// Ownership:
//   Owned by WealthEngine as a value member and passed by reference.
// -----------------------------------------------------------------------------
class InstrumentCatalog {
 public:
  InstrumentCatalog() = default;

  InstrumentCatalog(const InstrumentCatalog&) = delete;
  InstrumentCatalog& operator=(const InstrumentCatalog&) = delete;

  // -------------------------------------------------------------------------
  // add(instrument)
  // -------------------------------------------------------------------------
  // @brief  Registers an instrument.
  //
  // @return false (and nothing stored) if the id is empty, the id is already
  //         registered, or the price is negative.
  // -------------------------------------------------------------------------
  bool add(const domain::Instrument& instrument);

  std::optional<domain::Instrument> find(const std::string& id) const;
  std::optional<domain::Instrument> findBySymbol(
      const std::string& symbol) const;

  // All instruments, ordered by id.
  std::vector<domain::Instrument> all() const;

  // -------------------------------------------------------------------------
  // updatePrice(id, price)
  // -------------------------------------------------------------------------
  // External price refresh. Returns false for an unknown id or a negative
  // price; the stored price is left untouched in both cases.
  // -------------------------------------------------------------------------
  bool updatePrice(const std::string& id, double price);

  // Delists an instrument. Returns false if it was not registered.
  bool remove(const std::string& id);

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::Instrument> instruments_;
};

}  // namespace folio
