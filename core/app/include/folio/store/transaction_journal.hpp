#pragma once

#include "folio/concurrent/id_generator.hpp"
#include "folio/domain/transaction.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// TransactionJournal
// -----------------------------------------------------------------------------
// Responsibility: Append-only record of executed fills (and, when fed
// externally, dividends and fees). append() assigns the id and returns the
// stored copy; nothing is ever updated or removed.
//
// A given order id appears at most once: append() refuses a second
// transaction for an order that already has one.
//
// Thread model: std::mutex around the vector. Appends happen on the fill
// thread outside the ledger lock.
// -----------------------------------------------------------------------------
class TransactionJournal {
 public:
  TransactionJournal() = default;

  TransactionJournal(const TransactionJournal&) = delete;
  TransactionJournal& operator=(const TransactionJournal&) = delete;

  std::optional<domain::Transaction> append(domain::Transaction transaction);

  std::vector<domain::Transaction> forPortfolio(
      const std::string& portfolio_id) const;
  std::optional<domain::Transaction> forOrder(domain::OrderId order_id) const;

  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  IdGenerator ids_;
  std::vector<domain::Transaction> entries_;
};

}  // namespace folio
