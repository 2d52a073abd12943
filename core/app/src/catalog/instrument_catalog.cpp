#include "folio/catalog/instrument_catalog.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace folio {

bool InstrumentCatalog::add(const domain::Instrument& instrument) {
  if (instrument.id.empty() || instrument.current_price < 0.0) {
    std::cerr << "[InstrumentCatalog] WARNING: refusing instrument id='"
              << instrument.id << "' price=" << instrument.current_price
              << "\n";
    return false;
  }

  std::unique_lock lock(mutex_);
  auto [it, inserted] = instruments_.emplace(instrument.id, instrument);
  return inserted;
}

std::optional<domain::Instrument> InstrumentCatalog::find(
    const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = instruments_.find(id);
  if (it == instruments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Instrument> InstrumentCatalog::findBySymbol(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  for (const auto& [id, instrument] : instruments_) {
    if (instrument.symbol == symbol) {
      return instrument;
    }
  }
  return std::nullopt;
}

std::vector<domain::Instrument> InstrumentCatalog::all() const {
  std::vector<domain::Instrument> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(instruments_.size());
    for (const auto& [id, instrument] : instruments_) {
      result.push_back(instrument);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Instrument& a, const domain::Instrument& b) {
              return a.id < b.id;
            });
  return result;
}

bool InstrumentCatalog::updatePrice(const std::string& id, double price) {
  if (price < 0.0) {
    return false;
  }
  std::unique_lock lock(mutex_);
  auto it = instruments_.find(id);
  if (it == instruments_.end()) {
    return false;
  }
  it->second.current_price = price;
  return true;
}

bool InstrumentCatalog::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  return instruments_.erase(id) > 0;
}

std::size_t InstrumentCatalog::size() const {
  std::shared_lock lock(mutex_);
  return instruments_.size();
}

}  // namespace folio
