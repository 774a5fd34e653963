#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/journal/event_journal.hpp"
#include "core/ledger/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/sale/purchase_ledger.hpp"
#include "core/sale/sale_registry.hpp"
#include "core/settlement/batch_orchestrator.hpp"

namespace allot {

// The engine state object. Every mutating entry point takes a CallContext first and
// runs its guard chain before touching state:
//   reentrancy lock -> owner (admin ops) | paused -> initialized (buyer ops).
// Committed changes are journaled and, when a state path is configured, snapshotted
// together with the owner, payment recipient and pause flag.
class SaleService {
public:
  Result init(const EngineConfig& config, INativeLedger& native, ITokenLedger& tokens);

  // Buyer ops. On success `data` carries the PurchaseCompleted event id and
  // last_receipt() describes what was charged, refunded and delivered.
  Result purchase(const CallContext& ctx, ItemId item, Quantity quantity);
  Result purchase_batch(const CallContext& ctx, const std::vector<ItemId>& items,
                        const std::vector<Quantity>& quantities);
  Result purchase_batch_aggregated(const CallContext& ctx, const std::vector<ItemId>& items,
                                   const std::vector<Quantity>& quantities);

  // Admin ops.
  Result configure_sale(const CallContext& ctx, const SaleDraft& draft);
  Result update_sale_params(const CallContext& ctx, ItemId item, Amount new_price, Timestamp new_end_time);
  Result set_sale_active(const CallContext& ctx, ItemId item, bool active);
  Result set_asset_ledger(const CallContext& ctx, IAssetLedger* assets);
  Result set_payment_recipient(const CallContext& ctx, const Address& recipient);
  Result set_paused(const CallContext& ctx, bool paused);
  Result withdraw_items(const CallContext& ctx, const std::vector<ItemId>& items,
                        const std::vector<std::uint64_t>& amounts);
  Result withdraw_native_balance(const CallContext& ctx);
  Result withdraw_token_balance(const CallContext& ctx, const Address& token);
  Result transfer_ownership(const CallContext& ctx, const Address& new_owner);

  // Deposit notification from the asset ledger; any other caller is refused.
  Result on_items_received(const CallContext& ctx, const Address& from, ItemId item, std::uint64_t amount);

  [[nodiscard]] std::vector<ItemId> active_items() const;
  [[nodiscard]] ActiveSalePage active_sales_page(std::size_t offset, std::size_t limit) const;
  [[nodiscard]] std::vector<ItemId> live_items(Timestamp now) const;
  [[nodiscard]] SaleSnapshot sale(ItemId item) const;
  [[nodiscard]] BuyerStatus buyer_status(ItemId item, const Address& buyer, Timestamp now) const;
  [[nodiscard]] bool is_active(ItemId item) const;
  [[nodiscard]] SupplySnapshot remaining_supply(ItemId item) const;
  [[nodiscard]] std::uint64_t withdrawable_items(ItemId item) const;
  [[nodiscard]] std::optional<Amount> quote(ItemId item, Quantity quantity) const;

  [[nodiscard]] const Address& owner() const { return owner_; }
  [[nodiscard]] const Address& payment_recipient() const { return payment_recipient_; }
  [[nodiscard]] bool paused() const { return paused_; }
  [[nodiscard]] const BatchReceipt& last_receipt() const { return last_receipt_; }
  [[nodiscard]] const EventJournal& journal() const { return journal_; }
  [[nodiscard]] const SaleRegistry& registry() const { return registry_; }
  [[nodiscard]] const PurchaseLedger& ledger() const { return ledger_; }

private:
  class ReentrancyLock;

  Result admin_guards(const CallContext& ctx, const ReentrancyLock& lock, const char* op) const;
  Result buyer_guards(const CallContext& ctx, const ReentrancyLock& lock) const;

  Result run_purchase(const CallContext& ctx, const std::vector<ItemId>& items,
                      const std::vector<Quantity>& quantities, std::optional<SettlementStrategy> strategy);
  std::string commit(EventKind kind, const CallContext& ctx, util::FieldList fields);
  void persist_state() const;

  EngineConfig config_;
  Address owner_;
  Address payment_recipient_;
  INativeLedger* native_ = nullptr;
  ITokenLedger* tokens_ = nullptr;
  IAssetLedger* assets_ = nullptr;

  SaleRegistry registry_;
  PurchaseLedger ledger_;
  EventJournal journal_;
  BatchReceipt last_receipt_;

  bool started_ = false;
  bool paused_ = false;
  bool entered_ = false;
};

}  // namespace allot
