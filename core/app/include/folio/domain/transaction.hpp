#pragma once

#include "folio/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace folio {
namespace domain {

enum class TransactionType {
  Buy,
  Sell,
  Dividend,
  Fee,
};

const char* transactionTypeToString(TransactionType type);

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
// Responsibility: Immutable record of money and quantity moving in a
// portfolio. Fills produce exactly one Buy or Sell transaction each, linked
// 1:1 to the order through order_id.
//
// amount = quantity × price. For Sell fills realized_gain holds
// quantity × (price − average cost at the time of the fill); the holding
// itself does not track realized results.
// -----------------------------------------------------------------------------
struct Transaction {
  std::uint64_t id{};
  std::string portfolio_id;
  std::string instrument_id;
  TransactionType type{TransactionType::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  double amount{0.0};
  std::optional<double> realized_gain;
  std::int64_t timestamp_ms{0};
  std::optional<OrderId> order_id;
};

}  // namespace domain
}  // namespace folio
