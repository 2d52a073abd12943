#include "folio/store/transaction_journal.hpp"

#include <iostream>

namespace folio {

std::optional<domain::Transaction> TransactionJournal::append(
    domain::Transaction transaction) {
  std::lock_guard lock(mutex_);
  if (transaction.order_id) {
    for (const auto& existing : entries_) {
      if (existing.order_id == transaction.order_id) {
        std::cerr << "[TransactionJournal] WARNING: order_id="
                  << *transaction.order_id
                  << " already has a transaction. Skipping.\n";
        return std::nullopt;
      }
    }
  }
  transaction.id = ids_.next_id();
  entries_.push_back(transaction);
  return transaction;
}

std::vector<domain::Transaction> TransactionJournal::forPortfolio(
    const std::string& portfolio_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Transaction> result;
  for (const auto& entry : entries_) {
    if (entry.portfolio_id == portfolio_id) {
      result.push_back(entry);
    }
  }
  return result;
}

std::optional<domain::Transaction> TransactionJournal::forOrder(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  for (const auto& entry : entries_) {
    if (entry.order_id == order_id) {
      return entry;
    }
  }
  return std::nullopt;
}

std::size_t TransactionJournal::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace folio
