#include "folio/ledger/portfolio_ledger.hpp"

#include <algorithm>
#include <iostream>

namespace folio {

const char* fillStatusToString(FillStatus status) {
  switch (status) {
    case FillStatus::Applied:
      return "Applied";
    case FillStatus::InsufficientCash:
      return "InsufficientCash";
    case FillStatus::InsufficientHoldings:
      return "InsufficientHoldings";
    case FillStatus::InvalidFill:
      return "InvalidFill";
    case FillStatus::UnknownPortfolio:
      return "UnknownPortfolio";
  }
  return "Unknown";
}

PortfolioLedger::Account* PortfolioLedger::account(
    const std::string& portfolio_id) const {
  std::shared_lock lock(accounts_mutex_);
  auto it = accounts_.find(portfolio_id);
  return it == accounts_.end() ? nullptr : it->second.get();
}

bool PortfolioLedger::openPortfolio(const domain::Portfolio& portfolio) {
  if (portfolio.id.empty() || portfolio.cash < 0.0) {
    std::cerr << "[PortfolioLedger] Refusing to open portfolio '"
              << portfolio.id << "' with cash " << portfolio.cash << "\n";
    return false;
  }
  std::unique_lock lock(accounts_mutex_);
  auto [it, inserted] = accounts_.emplace(portfolio.id, nullptr);
  if (!inserted) {
    std::cerr << "[PortfolioLedger] Portfolio '" << portfolio.id
              << "' already open\n";
    return false;
  }
  it->second = std::make_unique<Account>(portfolio);
  return true;
}

bool PortfolioLedger::hydrateHolding(const domain::Holding& holding) {
  Account* acc = account(holding.portfolio_id);
  if (acc == nullptr) {
    return false;
  }
  std::lock_guard lock(acc->mutex);
  return acc->holdings.hydrate(holding);
}

bool PortfolioLedger::contains(const std::string& portfolio_id) const {
  return account(portfolio_id) != nullptr;
}

std::optional<domain::PortfolioSnapshot> PortfolioLedger::snapshot(
    const std::string& portfolio_id) const {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(acc->mutex);
  domain::PortfolioSnapshot snap;
  snap.portfolio = acc->portfolio;
  snap.portfolio.cash = acc->cash.cash();
  snap.holdings = acc->holdings.all();
  snap.reserved_cash = acc->cash.reserved();
  return snap;
}

std::optional<CashCheck> PortfolioLedger::checkCash(
    const std::string& portfolio_id, double required) const {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(acc->mutex);
  return acc->cash.checkSufficiency(required);
}

std::optional<CashCheck> PortfolioLedger::reserveCash(
    const std::string& portfolio_id, double amount) {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(acc->mutex);
  return acc->cash.reserve(amount);
}

void PortfolioLedger::releaseCash(const std::string& portfolio_id,
                                  double amount) {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return;
  }
  std::lock_guard lock(acc->mutex);
  acc->cash.release(amount);
}

std::optional<std::int64_t> PortfolioLedger::availableQuantity(
    const std::string& portfolio_id, const std::string& instrument_id) const {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(acc->mutex);
  return acc->holdings.availableQuantity(instrument_id);
}

bool PortfolioLedger::reserveHoldings(const std::string& portfolio_id,
                                      const std::string& instrument_id,
                                      std::int64_t quantity) {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return false;
  }
  std::lock_guard lock(acc->mutex);
  return acc->holdings.reserve(instrument_id, quantity);
}

void PortfolioLedger::releaseHoldings(const std::string& portfolio_id,
                                      const std::string& instrument_id,
                                      std::int64_t quantity) {
  Account* acc = account(portfolio_id);
  if (acc == nullptr) {
    return;
  }
  std::lock_guard lock(acc->mutex);
  acc->holdings.release(instrument_id, quantity);
}

FillResult PortfolioLedger::applyFill(const domain::Order& order,
                                      double price, std::int64_t now_ms) {
  FillResult result;
  Account* acc = account(order.portfolio_id);
  if (acc == nullptr) {
    std::cerr << "[PortfolioLedger] Fill for unknown portfolio '"
              << order.portfolio_id << "' (order " << order.id << ")\n";
    return result;
  }

  std::lock_guard lock(acc->mutex);

  if (order.side == domain::Side::Buy) {
    acc->cash.release(order.reserved_cash);
  } else {
    acc->holdings.release(order.instrument_id, order.quantity);
  }

  if (price <= 0.0) {
    std::cerr << "[PortfolioLedger] Fill price " << price << " for order "
              << order.id << " is not positive\n";
    result.status = FillStatus::InvalidFill;
    return result;
  }

  auto new_cash = acc->cash.projectFill(order.side, order.quantity, price);
  if (!new_cash) {
    result.status = FillStatus::InsufficientCash;
    return result;
  }

  auto change = acc->holdings.previewFill(order.side, order.instrument_id,
                                          order.quantity, price, now_ms);
  if (!change && order.side == domain::Side::Buy) {
    std::cerr << "[PortfolioLedger] BUY of " << order.quantity << " "
              << order.instrument_id << " would overflow the holding in '"
              << order.portfolio_id << "' (order " << order.id << ")\n";
    result.status = FillStatus::InvalidFill;
    return result;
  }
  if (!change) {
    std::cerr << "[PortfolioLedger] SELL of " << order.quantity << " "
              << order.instrument_id << " exceeds holding in portfolio '"
              << order.portfolio_id << "' (order " << order.id << ")\n";
    result.status = FillStatus::InsufficientHoldings;
    return result;
  }

  acc->cash.commit(*new_cash);
  acc->holdings.commit(*change);
  acc->portfolio.cash = *new_cash;

  result.status = FillStatus::Applied;
  result.amount = static_cast<double>(order.quantity) * price;
  result.cash_after = *new_cash;
  result.holding = change->holding;
  result.holding_removed = change->removed;
  result.realized_gain = change->realized_gain;
  return result;
}

std::vector<std::string> PortfolioLedger::portfolioIds() const {
  std::vector<std::string> ids;
  {
    std::shared_lock lock(accounts_mutex_);
    ids.reserve(accounts_.size());
    for (const auto& [id, acc] : accounts_) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace folio
