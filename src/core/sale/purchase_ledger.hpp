#pragma once

#include <compare>
#include <map>
#include <utility>

#include "core/model/types.hpp"
#include "core/sale/sale_registry.hpp"

namespace allot {

struct LedgerKey {
  ItemId item = 0;
  SaleVersion sale_version = 0;
  Address buyer;

  friend bool operator==(const LedgerKey&, const LedgerKey&) = default;
  friend auto operator<=>(const LedgerKey&, const LedgerKey&) = default;
};

// What `record` changed, so a request that fails later can put it back.
struct LedgerUndo {
  LedgerKey key;
  Quantity previous_total_sold = 0;
  Quantity previous_purchased = 0;
  bool created_entry = false;
};

// Per-buyer quota counters keyed by (item, sale version, buyer). Entries of
// superseded versions stay but are never consulted again.
class PurchaseLedger {
public:
  [[nodiscard]] Quantity purchased(ItemId item, SaleVersion sale_version, const Address& buyer) const;

  // Bumps the item's sold counter and the buyer's current-version counter together.
  // Both increments are checked before either is applied.
  Result record(SaleRegistry& registry, ItemId item, Quantity quantity, const Address& buyer, LedgerUndo& undo);
  void revert(SaleRegistry& registry, const LedgerUndo& undo);

  [[nodiscard]] const std::map<LedgerKey, Quantity>& entries() const { return entries_; }
  void restore(std::map<LedgerKey, Quantity> entries) { entries_ = std::move(entries); }

private:
  std::map<LedgerKey, Quantity> entries_;
};

}  // namespace allot
