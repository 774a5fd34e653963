#include "core/sale/purchase_ledger.hpp"

#include <string>

#include "core/util/checked_math.hpp"

namespace allot {

Quantity PurchaseLedger::purchased(ItemId item, SaleVersion sale_version, const Address& buyer) const {
  const auto found = entries_.find(LedgerKey{.item = item, .sale_version = sale_version, .buyer = buyer});
  return found == entries_.end() ? 0 : found->second;
}

Result PurchaseLedger::record(SaleRegistry& registry, ItemId item, Quantity quantity, const Address& buyer,
                              LedgerUndo& undo) {
  const SaleConfig* config = registry.find(item);
  if (config == nullptr) {
    return Result::failure(ErrorCode::SaleNotFound, "No sale configured for item " + std::to_string(item) + ".");
  }

  LedgerKey key{.item = item, .sale_version = config->sale_version, .buyer = buyer};
  const auto existing = entries_.find(key);
  const Quantity previous_purchased = existing == entries_.end() ? 0 : existing->second;

  const auto next_purchased = util::checked_add(previous_purchased, quantity);
  if (!next_purchased.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Buyer purchase counter would overflow.");
  }
  const Quantity previous_total_sold = config->total_sold;

  // add_sold is checked too; it fails before anything here has been written.
  const Result sold = registry.add_sold(item, quantity);
  if (!sold.ok) {
    return sold;
  }

  undo = LedgerUndo{
      .key = key,
      .previous_total_sold = previous_total_sold,
      .previous_purchased = previous_purchased,
      .created_entry = existing == entries_.end(),
  };
  entries_[std::move(key)] = *next_purchased;
  return Result::success();
}

void PurchaseLedger::revert(SaleRegistry& registry, const LedgerUndo& undo) {
  registry.restore_sold(undo.key.item, undo.previous_total_sold);
  if (undo.created_entry) {
    entries_.erase(undo.key);
  } else {
    entries_[undo.key] = undo.previous_purchased;
  }
}

}  // namespace allot
