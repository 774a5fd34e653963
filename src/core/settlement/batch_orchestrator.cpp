#include "core/settlement/batch_orchestrator.hpp"

#include <ranges>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/sale/purchase_validator.hpp"
#include "core/util/checked_math.hpp"

namespace allot {

BatchOrchestrator::BatchOrchestrator(SaleRegistry& registry, PurchaseLedger& ledger, PaymentSettlement& payments,
                                     IAssetLedger& assets, Address engine_account, std::size_t max_batch_size)
    : registry_(registry),
      ledger_(ledger),
      payments_(payments),
      assets_(assets),
      engine_account_(std::move(engine_account)),
      max_batch_size_(max_batch_size) {}

Result BatchOrchestrator::purchase(const CallContext& ctx, ItemId item, Quantity quantity, const Address& recipient,
                                   BatchReceipt& receipt) {
  if (quantity == 0) {
    return Result::failure(ErrorCode::ZeroAmount, "Purchase quantity must be positive.");
  }

  PurchaseLine line;
  const Result admitted = admit_and_price(ctx, item, quantity, line);
  if (!admitted.ok) {
    return admitted;
  }

  SettlementPlan plan;
  const Result charged = plan.charge_per_entry(line.payment_token, line.cost);
  if (!charged.ok) {
    return charged;
  }

  std::vector<PurchaseLine> lines{line};
  std::vector<LedgerUndo> undo;
  const Result recorded = record_lines(ctx, lines, undo);
  if (!recorded.ok) {
    rollback(undo);
    return recorded;
  }

  const Result delivered = settle_and_deliver(ctx, plan, lines, recipient, true, receipt);
  if (!delivered.ok) {
    rollback(undo);
  }
  return delivered;
}

Result BatchOrchestrator::purchase_batch(const CallContext& ctx, const std::vector<ItemId>& items,
                                         const std::vector<Quantity>& quantities, SettlementStrategy strategy,
                                         const Address& recipient, BatchReceipt& receipt) {
  const Result shape = check_batch_shape(items, quantities, max_batch_size_);
  if (!shape.ok) {
    return shape;
  }

  SettlementPlan plan;
  std::vector<PurchaseLine> lines;
  std::vector<LedgerUndo> undo;
  lines.reserve(items.size());
  undo.reserve(items.size());

  const Result staged = strategy == SettlementStrategy::PerItem
                            ? stage_per_item(ctx, items, quantities, plan, lines, undo)
                            : stage_aggregated(ctx, items, quantities, plan, lines, undo);
  if (!staged.ok) {
    rollback(undo);
    return staged;
  }

  const Result delivered = settle_and_deliver(ctx, plan, lines, recipient, false, receipt);
  if (!delivered.ok) {
    rollback(undo);
  }
  return delivered;
}

Result BatchOrchestrator::admit_and_price(const CallContext& ctx, ItemId item, Quantity quantity,
                                          PurchaseLine& line) const {
  const PurchaseValidator validator(registry_, ledger_, assets_, engine_account_);
  const Result admitted = validator.admit(item, quantity, ctx.caller, ctx.now);
  if (!admitted.ok) {
    spdlog::debug("purchase of item {} x{} by {} refused: {}", item, quantity, ctx.caller.value,
                  error_code_name(admitted.code));
    return admitted;
  }

  const SaleConfig& config = *registry_.find(item);
  const auto cost = util::checked_mul<Amount>(config.price, quantity);
  if (!cost.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Purchase cost overflows for item " + std::to_string(item) + ".");
  }

  line = PurchaseLine{
      .item = item,
      .quantity = quantity,
      .cost = *cost,
      .payment_token = config.payment_token,
      .sale_version = config.sale_version,
  };
  return Result::success();
}

Result BatchOrchestrator::stage_per_item(const CallContext& ctx, const std::vector<ItemId>& items,
                                         const std::vector<Quantity>& quantities, SettlementPlan& plan,
                                         std::vector<PurchaseLine>& lines, std::vector<LedgerUndo>& undo) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    PurchaseLine line;
    const Result admitted = admit_and_price(ctx, items[i], quantities[i], line);
    if (!admitted.ok) {
      return admitted;
    }
    const Result charged = plan.charge_per_entry(line.payment_token, line.cost);
    if (!charged.ok) {
      return charged;
    }

    // Recorded right away so the next entry is admitted against updated totals.
    LedgerUndo step;
    const Result recorded = ledger_.record(registry_, line.item, line.quantity, ctx.caller, step);
    if (!recorded.ok) {
      return recorded;
    }
    undo.push_back(std::move(step));
    lines.push_back(std::move(line));
  }
  return Result::success();
}

Result BatchOrchestrator::stage_aggregated(const CallContext& ctx, const std::vector<ItemId>& items,
                                           const std::vector<Quantity>& quantities, SettlementPlan& plan,
                                           std::vector<PurchaseLine>& lines, std::vector<LedgerUndo>& undo) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    PurchaseLine line;
    const Result admitted = admit_and_price(ctx, items[i], quantities[i], line);
    if (!admitted.ok) {
      return admitted;
    }
    const Result charged = plan.charge_aggregated(line.payment_token, line.cost);
    if (!charged.ok) {
      return charged;
    }
    lines.push_back(std::move(line));
  }
  return record_lines(ctx, lines, undo);
}

Result BatchOrchestrator::record_lines(const CallContext& ctx, const std::vector<PurchaseLine>& lines,
                                       std::vector<LedgerUndo>& undo) {
  for (const PurchaseLine& line : lines) {
    LedgerUndo step;
    const Result recorded = ledger_.record(registry_, line.item, line.quantity, ctx.caller, step);
    if (!recorded.ok) {
      return recorded;
    }
    undo.push_back(std::move(step));
  }
  return Result::success();
}

Result BatchOrchestrator::settle_and_deliver(const CallContext& ctx, const SettlementPlan& plan,
                                             const std::vector<PurchaseLine>& lines, const Address& recipient,
                                             bool single, BatchReceipt& receipt) {
  const Result tender = payments_.check_tender(plan, ctx.value);
  if (!tender.ok) {
    return tender;
  }
  const Result covered = payments_.preflight(plan, ctx);
  if (!covered.ok) {
    return covered;
  }

  HeldPayment held;
  SettlementReceipt paid;
  const Result collected = payments_.collect(plan, ctx, held, paid);
  if (!collected.ok) {
    spdlog::error("payment collection from {} failed after preflight ({} token pulls issued): {}", ctx.caller.value,
                  paid.token_pulls, collected.message);
    return_payment(ctx, held);
    return collected;
  }

  std::vector<ItemId> items;
  std::vector<std::uint64_t> amounts;
  for (const PurchaseLine& line : lines) {
    items.push_back(line.item);
    amounts.push_back(line.quantity);
  }

  const Result delivered = single ? assets_.safe_transfer(engine_account_, ctx.caller, items.front(), amounts.front())
                                  : assets_.safe_batch_transfer(engine_account_, ctx.caller, items, amounts);
  if (!delivered.ok) {
    spdlog::error("item delivery to {} failed, returning payment: {}", ctx.caller.value, delivered.message);
    return_payment(ctx, held);
    return Result::failure(ErrorCode::TransferFailed, "Item delivery failed: " + delivered.message);
  }

  // The items are out; from here the purchase stands even if a payout is refused.
  const Result released = payments_.release(plan, ctx, recipient, held, paid);
  if (!released.ok) {
    spdlog::critical("purchase by {} delivered but payout stalled ({} native, {} token charges left on {}): {}",
                     ctx.caller.value, held.native, held.tokens.size(), engine_account_.value, released.message);
  }

  receipt.buyer = ctx.caller;
  receipt.lines = lines;
  receipt.native_charged = paid.native_charged;
  receipt.native_refunded = paid.native_refunded;
  receipt.token_pulls = paid.token_pulls;
  return Result::success("Purchase settled.");
}

void BatchOrchestrator::return_payment(const CallContext& ctx, HeldPayment& held) {
  if (held.empty()) {
    return;
  }
  const Result returned = payments_.return_held(ctx, held);
  if (!returned.ok) {
    spdlog::critical("payment return to {} incomplete ({} native, {} token charges left on {}): {}", ctx.caller.value,
                     held.native, held.tokens.size(), engine_account_.value, returned.message);
  }
}

void BatchOrchestrator::rollback(const std::vector<LedgerUndo>& undo) {
  for (const LedgerUndo& step : std::views::reverse(undo)) {
    ledger_.revert(registry_, step);
  }
}

}  // namespace allot
