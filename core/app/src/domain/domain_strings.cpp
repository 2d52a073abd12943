#include "folio/domain/asset_class.hpp"
#include "folio/domain/audit_event.hpp"
#include "folio/domain/order.hpp"
#include "folio/domain/order_status.hpp"
#include "folio/domain/risk_profile.hpp"
#include "folio/domain/transaction.hpp"

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// AssetClass
// -----------------------------------------------------------------------------
const char* assetClassToString(AssetClass asset_class) {
  switch (asset_class) {
    case AssetClass::Equity:      return "EQUITY";
    case AssetClass::FixedIncome: return "FIXED_INCOME";
    case AssetClass::Cash:        return "CASH";
    case AssetClass::Alternative: return "ALTERNATIVE";
    case AssetClass::RealEstate:  return "REAL_ESTATE";
  }
  return "UNKNOWN";
}

std::optional<AssetClass> parseAssetClass(const std::string& name) {
  for (AssetClass c : kAllAssetClasses) {
    if (name == assetClassToString(c)) {
      return c;
    }
  }
  return std::nullopt;
}

int defaultRiskRating(AssetClass asset_class) {
  switch (asset_class) {
    case AssetClass::Cash:        return 0;
    case AssetClass::FixedIncome: return 1;
    case AssetClass::Equity:      return 5;
    case AssetClass::RealEstate:  return 6;
    case AssetClass::Alternative: return 7;
  }
  return kMaxRiskScore;
}

// -----------------------------------------------------------------------------
// RiskCategory
// -----------------------------------------------------------------------------
const char* riskCategoryToString(RiskCategory category) {
  switch (category) {
    case RiskCategory::Conservative: return "CONSERVATIVE";
    case RiskCategory::Moderate:     return "MODERATE";
    case RiskCategory::Balanced:     return "BALANCED";
    case RiskCategory::Growth:       return "GROWTH";
    case RiskCategory::Aggressive:   return "AGGRESSIVE";
  }
  return "UNKNOWN";
}

std::optional<RiskCategory> parseRiskCategory(const std::string& name) {
  using C = RiskCategory;
  for (C c : {C::Conservative, C::Moderate, C::Balanced, C::Growth,
              C::Aggressive}) {
    if (name == riskCategoryToString(c)) {
      return c;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Order enums
// -----------------------------------------------------------------------------
const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:  return "PENDING";
    case OrderStatus::Executed: return "EXECUTED";
    case OrderStatus::Failed:   return "FAILED";
  }
  return "UNKNOWN";
}

const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* orderTypeToString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "MARKET";
    case OrderType::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

std::optional<Side> parseSide(const std::string& name) {
  if (name == "BUY") return Side::Buy;
  if (name == "SELL") return Side::Sell;
  return std::nullopt;
}

std::optional<OrderType> parseOrderType(const std::string& name) {
  if (name == "MARKET") return OrderType::Market;
  if (name == "LIMIT") return OrderType::Limit;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Records
// -----------------------------------------------------------------------------
const char* transactionTypeToString(TransactionType type) {
  switch (type) {
    case TransactionType::Buy:      return "BUY";
    case TransactionType::Sell:     return "SELL";
    case TransactionType::Dividend: return "DIVIDEND";
    case TransactionType::Fee:      return "FEE";
  }
  return "UNKNOWN";
}

const char* auditEventTypeToString(AuditEventType type) {
  switch (type) {
    case AuditEventType::OrderCreated:  return "ORDER_CREATED";
    case AuditEventType::OrderExecuted: return "ORDER_EXECUTED";
    case AuditEventType::OrderFailed:   return "ORDER_FAILED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace folio
