#include "folio/ledger/holdings_book.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace folio {

HoldingsBook::HoldingsBook(std::string portfolio_id)
    : portfolio_id_(std::move(portfolio_id)) {}

bool HoldingsBook::hydrate(const domain::Holding& holding) {
  if (holding.quantity <= 0 || holding.average_cost <= 0.0) {
    return false;
  }
  if (holding.portfolio_id != portfolio_id_) {
    return false;
  }
  holdings_[holding.instrument_id] = holding;
  return true;
}

std::optional<domain::Holding> HoldingsBook::find(
    const std::string& instrument_id) const {
  auto it = holdings_.find(instrument_id);
  if (it == holdings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Holding> HoldingsBook::all() const {
  std::vector<domain::Holding> result;
  result.reserve(holdings_.size());
  for (const auto& [id, holding] : holdings_) {
    result.push_back(holding);
  }
  return result;
}

std::int64_t HoldingsBook::heldQuantity(
    const std::string& instrument_id) const {
  auto it = holdings_.find(instrument_id);
  return it == holdings_.end() ? 0 : it->second.quantity;
}

std::int64_t HoldingsBook::reservedQuantity(
    const std::string& instrument_id) const {
  auto it = reserved_.find(instrument_id);
  return it == reserved_.end() ? 0 : it->second;
}

std::int64_t HoldingsBook::availableQuantity(
    const std::string& instrument_id) const {
  return std::max<std::int64_t>(
      heldQuantity(instrument_id) - reservedQuantity(instrument_id), 0);
}

bool HoldingsBook::reserve(const std::string& instrument_id,
                           std::int64_t quantity) {
  if (quantity <= 0 || availableQuantity(instrument_id) < quantity) {
    return false;
  }
  reserved_[instrument_id] += quantity;
  return true;
}

void HoldingsBook::release(const std::string& instrument_id,
                           std::int64_t quantity) {
  auto it = reserved_.find(instrument_id);
  if (it == reserved_.end()) {
    return;
  }
  it->second -= quantity;
  if (it->second <= 0) {
    reserved_.erase(it);
  }
}

std::optional<HoldingChange> HoldingsBook::previewFill(
    domain::Side side, const std::string& instrument_id,
    std::int64_t quantity, double price, std::int64_t now_ms) const {
  if (quantity <= 0 || price <= 0.0) {
    return std::nullopt;
  }

  auto it = holdings_.find(instrument_id);
  HoldingChange change;

  if (side == domain::Side::Buy) {
    if (it != holdings_.end() &&
        it->second.quantity >
            std::numeric_limits<std::int64_t>::max() - quantity) {
      return std::nullopt;
    }
    if (it == holdings_.end()) {
      change.holding.portfolio_id = portfolio_id_;
      change.holding.instrument_id = instrument_id;
      change.holding.quantity = quantity;
      change.holding.average_cost = price;
    } else {
      const domain::Holding& old = it->second;
      const std::int64_t new_quantity = old.quantity + quantity;
      const double old_cost =
          static_cast<double>(old.quantity) * old.average_cost;
      const double added_cost = static_cast<double>(quantity) * price;
      change.holding = old;
      change.holding.quantity = new_quantity;
      change.holding.average_cost =
          (old_cost + added_cost) / static_cast<double>(new_quantity);
    }
    change.holding.last_updated_ms = now_ms;
    return change;
  }

  if (it == holdings_.end() || it->second.quantity < quantity) {
    return std::nullopt;
  }

  change.holding = it->second;
  change.holding.quantity -= quantity;
  change.holding.last_updated_ms = now_ms;
  change.removed = change.holding.quantity <= 0;
  change.realized_gain = static_cast<double>(quantity) *
                         (price - it->second.average_cost);
  return change;
}

void HoldingsBook::commit(const HoldingChange& change) {
  if (change.removed) {
    holdings_.erase(change.holding.instrument_id);
    return;
  }
  holdings_[change.holding.instrument_id] = change.holding;
}

}  // namespace folio
