#pragma once

#include "folio/domain/order.hpp"
#include "folio/domain/portfolio.hpp"
#include "folio/ledger/cash_ledger.hpp"
#include "folio/ledger/holdings_book.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace folio {

enum class FillStatus {
  Applied,
  InsufficientCash,
  InsufficientHoldings,
  InvalidFill,  // Price <= 0, or a BUY that would overflow the position size
  UnknownPortfolio,
};

const char* fillStatusToString(FillStatus status);

// -----------------------------------------------------------------------------
// FillResult
// -----------------------------------------------------------------------------
// Outcome of PortfolioLedger::applyFill(). Only status is meaningful unless
// status == Applied. holding is the post-fill position (or, when
// holding_removed, the position as it was erased).
// -----------------------------------------------------------------------------
struct FillResult {
  FillStatus status{FillStatus::UnknownPortfolio};
  double amount{0.0};
  double cash_after{0.0};
  domain::Holding holding;
  bool holding_removed{false};
  std::optional<double> realized_gain;
};

// -----------------------------------------------------------------------------
// PortfolioLedger — cash and holdings of every portfolio
// -----------------------------------------------------------------------------
//
// @brief  The single owner of mutable money and position state. Each
//         portfolio is an account holding a CashLedger and a HoldingsBook
//         behind its own mutex.
//
// @details
// applyFill() is the one transactional entry point for a fill:
//
//   1. Lock the portfolio.
//   2. Release the reservation the order made at submission (its estimated
//      cost for a BUY, its quantity for a SELL).
//   3. Project the cash balance and preview the holding change.
//   4. If either projection fails, return without mutating.
//   5. Otherwise commit both before unlocking.
//
// No reader ever sees cash updated without the matching holding, and a
// failed fill changes nothing except dropping the order's reservation.
//
// Locking:
//   accounts_mutex_ (shared_mutex) guards the account map. Accounts are
//   never erased, so a pointer obtained under a shared lock stays valid
//   after the map lock is released. Per-account std::mutex guards the
//   account contents. Portfolios never lock each other.
//
// Ownership:
//   Owned by WealthEngine; OrderEngine and the analytics hold references.
// -----------------------------------------------------------------------------
class PortfolioLedger {
 public:
  PortfolioLedger() = default;

  PortfolioLedger(const PortfolioLedger&) = delete;
  PortfolioLedger& operator=(const PortfolioLedger&) = delete;

  // -------------------------------------------------------------------------
  // openPortfolio(portfolio)
  // -------------------------------------------------------------------------
  // Creates the account with portfolio.cash as settled balance. Returns
  // false for an empty or already-open id, or negative cash.
  // -------------------------------------------------------------------------
  bool openPortfolio(const domain::Portfolio& portfolio);

  // Loads a seed position into an open portfolio. Returns false for an
  // unknown portfolio or an invalid holding (see HoldingsBook::hydrate).
  bool hydrateHolding(const domain::Holding& holding);

  bool contains(const std::string& portfolio_id) const;

  std::optional<domain::PortfolioSnapshot> snapshot(
      const std::string& portfolio_id) const;

  // -------------------------------------------------------------------------
  // Reservations
  // -------------------------------------------------------------------------
  // reserveCash checks and reserves under one lock; the returned CashCheck
  // says whether it happened. reserveHoldings returns false when fewer than
  // quantity units are free. Both return std::nullopt / false for an
  // unknown portfolio.
  // -------------------------------------------------------------------------
  std::optional<CashCheck> checkCash(const std::string& portfolio_id,
                                     double required) const;
  std::optional<CashCheck> reserveCash(const std::string& portfolio_id,
                                       double amount);
  void releaseCash(const std::string& portfolio_id, double amount);

  std::optional<std::int64_t> availableQuantity(
      const std::string& portfolio_id, const std::string& instrument_id) const;
  bool reserveHoldings(const std::string& portfolio_id,
                       const std::string& instrument_id,
                       std::int64_t quantity);
  void releaseHoldings(const std::string& portfolio_id,
                       const std::string& instrument_id,
                       std::int64_t quantity);

  // -------------------------------------------------------------------------
  // applyFill(order, price, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Applies order.quantity at price to cash and holdings as one
  //         unit, releasing the order's reservation (order.reserved_cash
  //         for a BUY, order.quantity for a SELL) whatever the outcome.
  // -------------------------------------------------------------------------
  FillResult applyFill(const domain::Order& order, double price,
                       std::int64_t now_ms);

  std::vector<std::string> portfolioIds() const;

 private:
  struct Account {
    explicit Account(domain::Portfolio p)
        : portfolio(std::move(p)),
          cash(portfolio.cash),
          holdings(portfolio.id) {}

    mutable std::mutex mutex;
    domain::Portfolio portfolio;
    CashLedger cash;
    HoldingsBook holdings;
  };

  Account* account(const std::string& portfolio_id) const;

  mutable std::shared_mutex accounts_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Account>> accounts_;
};

}  // namespace folio
