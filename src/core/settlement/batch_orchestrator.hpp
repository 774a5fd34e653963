#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/ledger/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/sale/purchase_ledger.hpp"
#include "core/sale/sale_registry.hpp"
#include "core/settlement/payment_settlement.hpp"

namespace allot {

enum class SettlementStrategy {
  // One token pull per entry; entries are recorded as soon as they are admitted.
  PerItem,
  // All entries admitted first, then one token pull per distinct payment token.
  Aggregated,
};

// Shape checks shared by purchase and withdrawal batches: bound, parallel lengths,
// zero amounts and repeated items (pairwise; the bound keeps this cheap).
template <typename AmountT>
Result check_batch_shape(const std::vector<ItemId>& items, const std::vector<AmountT>& amounts,
                         std::size_t max_batch_size) {
  if (items.size() > max_batch_size || amounts.size() > max_batch_size) {
    return Result::failure(ErrorCode::BatchTooLarge,
                           "Batch holds more than " + std::to_string(max_batch_size) + " entries.");
  }
  if (items.size() != amounts.size()) {
    return Result::failure(ErrorCode::ArrayLengthMismatch, "Batch items and amounts differ in length.");
  }
  if (items.empty()) {
    return Result::failure(ErrorCode::ZeroAmount, "Batch is empty.");
  }
  for (const AmountT amount : amounts) {
    if (amount == 0) {
      return Result::failure(ErrorCode::ZeroAmount, "Batch entry amount must be positive.");
    }
  }
  for (std::size_t i = 0; i < items.size(); ++i) {
    for (std::size_t j = i + 1U; j < items.size(); ++j) {
      if (items[i] == items[j]) {
        return Result::failure(ErrorCode::DuplicateItem,
                               "Item " + std::to_string(items[i]) + " appears more than once in the batch.");
      }
    }
  }
  return Result::success();
}

// Runs a purchase request as a staged plan: admission and bookkeeping first, then
// payment is collected onto the engine account, then one asset transfer, then the
// payment is paid out. A failure before the payout returns the collected payment and
// undoes the bookkeeping, so the request either settles every entry or none.
class BatchOrchestrator {
public:
  BatchOrchestrator(SaleRegistry& registry, PurchaseLedger& ledger, PaymentSettlement& payments,
                    IAssetLedger& assets, Address engine_account, std::size_t max_batch_size);

  Result purchase(const CallContext& ctx, ItemId item, Quantity quantity, const Address& recipient,
                  BatchReceipt& receipt);
  Result purchase_batch(const CallContext& ctx, const std::vector<ItemId>& items,
                        const std::vector<Quantity>& quantities, SettlementStrategy strategy,
                        const Address& recipient, BatchReceipt& receipt);

private:
  Result admit_and_price(const CallContext& ctx, ItemId item, Quantity quantity, PurchaseLine& line) const;
  Result stage_per_item(const CallContext& ctx, const std::vector<ItemId>& items,
                        const std::vector<Quantity>& quantities, SettlementPlan& plan,
                        std::vector<PurchaseLine>& lines, std::vector<LedgerUndo>& undo);
  Result stage_aggregated(const CallContext& ctx, const std::vector<ItemId>& items,
                          const std::vector<Quantity>& quantities, SettlementPlan& plan,
                          std::vector<PurchaseLine>& lines, std::vector<LedgerUndo>& undo);
  Result record_lines(const CallContext& ctx, const std::vector<PurchaseLine>& lines, std::vector<LedgerUndo>& undo);
  Result settle_and_deliver(const CallContext& ctx, const SettlementPlan& plan, const std::vector<PurchaseLine>& lines,
                            const Address& recipient, bool single, BatchReceipt& receipt);
  void return_payment(const CallContext& ctx, HeldPayment& held);
  void rollback(const std::vector<LedgerUndo>& undo);

  SaleRegistry& registry_;
  PurchaseLedger& ledger_;
  PaymentSettlement& payments_;
  IAssetLedger& assets_;
  Address engine_account_;
  std::size_t max_batch_size_;
};

}  // namespace allot
