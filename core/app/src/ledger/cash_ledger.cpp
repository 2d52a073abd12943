#include "folio/ledger/cash_ledger.hpp"

#include <algorithm>

namespace folio {

CashLedger::CashLedger(double opening_cash) : cash_(opening_cash) {}

double CashLedger::available() const {
  return std::max(cash_ - reserved_, 0.0);
}

CashCheck CashLedger::checkSufficiency(double estimated_cost) const {
  CashCheck check;
  check.available = available();
  check.required = estimated_cost;
  check.sufficient = check.available >= estimated_cost;
  return check;
}

CashCheck CashLedger::reserve(double amount) {
  CashCheck check = checkSufficiency(amount);
  if (check.sufficient) {
    reserved_ += amount;
  }
  return check;
}

void CashLedger::release(double amount) {
  reserved_ = std::max(reserved_ - amount, 0.0);
}

std::optional<double> CashLedger::projectFill(domain::Side side,
                                              std::int64_t quantity,
                                              double price) const {
  const double amount = static_cast<double>(quantity) * price;
  if (side == domain::Side::Sell) {
    return cash_ + amount;
  }
  if (amount > cash_) {
    return std::nullopt;
  }
  return cash_ - amount;
}

}  // namespace folio
