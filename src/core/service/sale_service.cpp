#include "core/service/sale_service.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/config/engine_config.hpp"
#include "core/sale/inventory_guard.hpp"
#include "core/settlement/payment_settlement.hpp"
#include "core/storage/state_store.hpp"
#include "core/util/checked_math.hpp"
#include "core/util/log.hpp"

namespace allot {
namespace {

template <typename T>
std::string join_csv(const std::vector<T>& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << values[i];
  }
  return out.str();
}

std::string bool_field(bool value) {
  return value ? "1" : "0";
}

}  // namespace

// Held for the whole of a mutating entry point. A nested entry sees the flag already
// set, does not acquire, and is refused by the guard chain.
class SaleService::ReentrancyLock {
public:
  explicit ReentrancyLock(bool& entered) : entered_(entered), acquired_(!entered) {
    if (acquired_) {
      entered_ = true;
    }
  }
  ~ReentrancyLock() {
    if (acquired_) {
      entered_ = false;
    }
  }

  ReentrancyLock(const ReentrancyLock&) = delete;
  ReentrancyLock& operator=(const ReentrancyLock&) = delete;

  [[nodiscard]] bool acquired() const { return acquired_; }

private:
  bool& entered_;
  bool acquired_;
};

Result SaleService::init(const EngineConfig& config, INativeLedger& native, ITokenLedger& tokens) {
  if (entered_) {
    return Result::failure(ErrorCode::ReentrantCall, "Engine cannot be re-initialized from inside a request.");
  }

  const Result valid = validate_engine_config(config);
  if (!valid.ok) {
    return valid;
  }

  const Result logging = util::init_logging(config.logging);
  if (!logging.ok) {
    return logging;
  }

  EventJournal journal;
  const Result opened = journal.open(config.journal_path);
  if (!opened.ok) {
    spdlog::error("journal open failed: {}", opened.message);
    return opened;
  }

  std::optional<EngineControls> controls;
  SaleRegistry registry;
  PurchaseLedger ledger;
  const StateStore store(config.state_path);
  if (store.exists()) {
    const Result loaded = store.load(controls, registry, ledger);
    if (!loaded.ok) {
      spdlog::error("state snapshot {} rejected: {}", store.path(), loaded.message);
      return loaded;
    }
    spdlog::info("restored {} sales ({} active) from {}", registry.configs().size(), registry.active_items().size(),
                 store.path());
  }

  config_ = config;
  owner_ = controls.has_value() ? controls->owner : config.owner;
  payment_recipient_ = controls.has_value() ? controls->payment_recipient : config.payment_recipient;
  native_ = &native;
  tokens_ = &tokens;
  assets_ = nullptr;
  registry_ = std::move(registry);
  ledger_ = std::move(ledger);
  journal_ = std::move(journal);
  last_receipt_ = {};
  paused_ = controls.has_value() && controls->paused;
  started_ = true;

  spdlog::info("engine ready: owner={} account={} batch bound={}", owner_.value, config_.engine_account.value,
               config_.max_batch_size);
  return Result::success("Sale engine initialized.");
}

Result SaleService::admin_guards(const CallContext& ctx, const ReentrancyLock& lock, const char* op) const {
  if (!lock.acquired()) {
    spdlog::warn("{} refused: reentrant call from {}", op, ctx.caller.value);
    return Result::failure(ErrorCode::ReentrantCall, "Engine is already processing a request.");
  }
  if (!started_) {
    return Result::failure(ErrorCode::NotInitialized, "Engine has not been initialized.");
  }
  if (ctx.caller != owner_) {
    spdlog::warn("{} refused: {} is not the owner", op, ctx.caller.value);
    return Result::failure(ErrorCode::NotOwner, "Only the owner may call " + std::string{op} + ".");
  }
  return Result::success();
}

Result SaleService::buyer_guards(const CallContext& ctx, const ReentrancyLock& lock) const {
  if (!lock.acquired()) {
    spdlog::warn("purchase refused: reentrant call from {}", ctx.caller.value);
    return Result::failure(ErrorCode::ReentrantCall, "Engine is already processing a request.");
  }
  if (paused_) {
    return Result::failure(ErrorCode::Paused, "Sales are paused.");
  }
  if (!started_ || assets_ == nullptr || payment_recipient_.empty()) {
    return Result::failure(ErrorCode::NotInitialized, "Asset ledger and payment recipient must be set.");
  }
  return Result::success();
}

Result SaleService::purchase(const CallContext& ctx, ItemId item, Quantity quantity) {
  ReentrancyLock lock(entered_);
  if (const Result guard = buyer_guards(ctx, lock); !guard.ok) {
    return guard;
  }
  return run_purchase(ctx, {item}, {quantity}, std::nullopt);
}

Result SaleService::purchase_batch(const CallContext& ctx, const std::vector<ItemId>& items,
                                   const std::vector<Quantity>& quantities) {
  ReentrancyLock lock(entered_);
  if (const Result guard = buyer_guards(ctx, lock); !guard.ok) {
    return guard;
  }
  return run_purchase(ctx, items, quantities, SettlementStrategy::PerItem);
}

Result SaleService::purchase_batch_aggregated(const CallContext& ctx, const std::vector<ItemId>& items,
                                              const std::vector<Quantity>& quantities) {
  ReentrancyLock lock(entered_);
  if (const Result guard = buyer_guards(ctx, lock); !guard.ok) {
    return guard;
  }
  return run_purchase(ctx, items, quantities, SettlementStrategy::Aggregated);
}

Result SaleService::run_purchase(const CallContext& ctx, const std::vector<ItemId>& items,
                                 const std::vector<Quantity>& quantities,
                                 std::optional<SettlementStrategy> strategy) {
  PaymentSettlement payments(*native_, *tokens_, config_.engine_account);
  BatchOrchestrator orchestrator(registry_, ledger_, payments, *assets_, config_.engine_account,
                                 config_.max_batch_size);

  BatchReceipt receipt;
  const Result settled = strategy.has_value()
                             ? orchestrator.purchase_batch(ctx, items, quantities, *strategy, payment_recipient_,
                                                           receipt)
                             : orchestrator.purchase(ctx, items.front(), quantities.front(), payment_recipient_,
                                                     receipt);
  if (!settled.ok) {
    return settled;
  }

  std::vector<ItemId> bought;
  std::vector<Quantity> counts;
  std::vector<SaleVersion> versions;
  for (const PurchaseLine& line : receipt.lines) {
    bought.push_back(line.item);
    counts.push_back(line.quantity);
    versions.push_back(line.sale_version);
  }

  const char* mode = !strategy.has_value()                          ? "single"
                     : *strategy == SettlementStrategy::Aggregated ? "aggregated"
                                                                   : "per_item";
  receipt.event_id = commit(EventKind::PurchaseCompleted, ctx,
                            {{"buyer", ctx.caller.value},
                             {"items", join_csv(bought)},
                             {"quantities", join_csv(counts)},
                             {"sale_versions", join_csv(versions)},
                             {"native_charged", std::to_string(receipt.native_charged)},
                             {"native_refunded", std::to_string(receipt.native_refunded)},
                             {"token_pulls", std::to_string(receipt.token_pulls)},
                             {"mode", mode}});

  spdlog::info("purchase by {}: items [{}] x [{}] ({}), native {} refunded {}, {} token pulls", ctx.caller.value,
               join_csv(bought), join_csv(counts), mode, receipt.native_charged, receipt.native_refunded,
               receipt.token_pulls);

  std::string event_id = receipt.event_id;
  last_receipt_ = std::move(receipt);
  return Result::success("Purchase completed.", std::move(event_id));
}

Result SaleService::configure_sale(const CallContext& ctx, const SaleDraft& draft) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "configure_sale"); !guard.ok) {
    return guard;
  }

  const Result configured = registry_.configure(draft, assets_, config_.engine_account);
  if (!configured.ok) {
    spdlog::warn("configure_sale for item {} rejected: {}", draft.item, configured.message);
    return configured;
  }

  const SaleConfig& config = *registry_.find(draft.item);
  commit(EventKind::SaleConfigured, ctx,
         {{"item", std::to_string(draft.item)},
          {"price", std::to_string(config.price)},
          {"start_time", std::to_string(config.start_time)},
          {"end_time", std::to_string(config.end_time)},
          {"max_supply", std::to_string(config.max_supply)},
          {"max_per_address", std::to_string(config.max_per_address)},
          {"payment_token", config.payment_token.value},
          {"sale_version", std::to_string(config.sale_version)}});
  spdlog::info("sale for item {} configured at version {}", draft.item, config.sale_version);
  return configured;
}

Result SaleService::update_sale_params(const CallContext& ctx, ItemId item, Amount new_price,
                                       Timestamp new_end_time) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "update_sale_params"); !guard.ok) {
    return guard;
  }

  const Result updated = registry_.update_params(item, new_price, new_end_time);
  if (!updated.ok) {
    spdlog::warn("update_sale_params for item {} rejected: {}", item, updated.message);
    return updated;
  }

  commit(EventKind::SaleParamsUpdated, ctx,
         {{"item", std::to_string(item)},
          {"price", std::to_string(new_price)},
          {"end_time", std::to_string(new_end_time)}});
  spdlog::info("sale for item {} now priced {} until {}", item, new_price, new_end_time);
  return updated;
}

Result SaleService::set_sale_active(const CallContext& ctx, ItemId item, bool active) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "set_sale_active"); !guard.ok) {
    return guard;
  }

  const Result changed = registry_.set_active(item, active, ctx.now, assets_, config_.engine_account);
  if (!changed.ok) {
    spdlog::warn("set_sale_active({}, {}) rejected: {}", item, active, changed.message);
    return changed;
  }

  commit(EventKind::SaleStatusChanged, ctx, {{"item", std::to_string(item)}, {"active", bool_field(active)}});
  spdlog::info("sale for item {} {}", item, active ? "activated" : "deactivated");
  return changed;
}

Result SaleService::set_asset_ledger(const CallContext& ctx, IAssetLedger* assets) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "set_asset_ledger"); !guard.ok) {
    return guard;
  }
  if (assets == nullptr || assets->address().empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "Asset ledger must have an address.");
  }

  assets_ = assets;
  commit(EventKind::AssetLedgerUpdated, ctx, {{"asset_ledger", assets_->address().value}});
  spdlog::info("asset ledger set to {}", assets_->address().value);
  return Result::success("Asset ledger updated.");
}

Result SaleService::set_payment_recipient(const CallContext& ctx, const Address& recipient) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "set_payment_recipient"); !guard.ok) {
    return guard;
  }
  if (recipient.empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "Payment recipient must not be empty.");
  }

  payment_recipient_ = recipient;
  commit(EventKind::PaymentRecipientUpdated, ctx, {{"payment_recipient", recipient.value}});
  spdlog::info("payment recipient set to {}", recipient.value);
  return Result::success("Payment recipient updated.");
}

Result SaleService::set_paused(const CallContext& ctx, bool paused) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "set_paused"); !guard.ok) {
    return guard;
  }

  paused_ = paused;
  commit(EventKind::PauseToggled, ctx, {{"paused", bool_field(paused)}});
  spdlog::info("sales {}", paused ? "paused" : "resumed");
  return Result::success(paused ? "Sales paused." : "Sales resumed.");
}

Result SaleService::withdraw_items(const CallContext& ctx, const std::vector<ItemId>& items,
                                   const std::vector<std::uint64_t>& amounts) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "withdraw_items"); !guard.ok) {
    return guard;
  }
  if (assets_ == nullptr) {
    return Result::failure(ErrorCode::NotInitialized, "Asset ledger is not set.");
  }

  const Result shape = check_batch_shape(items, amounts, config_.max_batch_size);
  if (!shape.ok) {
    return shape;
  }

  const InventoryGuard guard(registry_, *assets_, config_.engine_account);
  for (std::size_t i = 0; i < items.size(); ++i) {
    const Result allowed = guard.check_withdrawable(items[i], amounts[i]);
    if (!allowed.ok) {
      spdlog::warn("withdraw_items rejected: {}", allowed.message);
      return allowed;
    }
  }

  const Result moved = assets_->safe_batch_transfer(config_.engine_account, owner_, items, amounts);
  if (!moved.ok) {
    spdlog::error("item withdrawal to {} failed: {}", owner_.value, moved.message);
    return Result::failure(ErrorCode::TransferFailed, "Item withdrawal failed: " + moved.message);
  }

  commit(EventKind::ItemsWithdrawn, ctx,
         {{"to", owner_.value}, {"items", join_csv(items)}, {"amounts", join_csv(amounts)}});
  spdlog::info("withdrew items [{}] x [{}] to {}", join_csv(items), join_csv(amounts), owner_.value);
  return Result::success("Items withdrawn.");
}

Result SaleService::withdraw_native_balance(const CallContext& ctx) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "withdraw_native_balance"); !guard.ok) {
    return guard;
  }

  const Amount balance = native_->balance_of(config_.engine_account);
  if (balance == 0) {
    return Result::failure(ErrorCode::NothingToWithdraw, "Engine holds no native currency.");
  }

  const Result moved = native_->transfer(config_.engine_account, owner_, balance);
  if (!moved.ok) {
    spdlog::error("native withdrawal of {} failed: {}", balance, moved.message);
    return Result::failure(ErrorCode::TransferFailed, "Native withdrawal failed: " + moved.message);
  }

  commit(EventKind::NativeWithdrawn, ctx, {{"to", owner_.value}, {"amount", std::to_string(balance)}});
  spdlog::info("withdrew {} native to {}", balance, owner_.value);
  return Result::success("Native balance withdrawn.", std::to_string(balance));
}

Result SaleService::withdraw_token_balance(const CallContext& ctx, const Address& token) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "withdraw_token_balance"); !guard.ok) {
    return guard;
  }
  if (token.empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "Token address must not be empty.");
  }

  const Amount balance = tokens_->balance_of(token, config_.engine_account);
  if (balance == 0) {
    return Result::failure(ErrorCode::NothingToWithdraw, "Engine holds no " + token.value + ".");
  }

  const Result moved = tokens_->transfer(token, config_.engine_account, owner_, balance);
  if (!moved.ok) {
    spdlog::error("token withdrawal of {} {} failed: {}", balance, token.value, moved.message);
    return Result::failure(ErrorCode::TransferFailed, "Token withdrawal failed: " + moved.message);
  }

  commit(EventKind::TokenWithdrawn, ctx,
         {{"to", owner_.value}, {"token", token.value}, {"amount", std::to_string(balance)}});
  spdlog::info("withdrew {} {} to {}", balance, token.value, owner_.value);
  return Result::success("Token balance withdrawn.", std::to_string(balance));
}

Result SaleService::transfer_ownership(const CallContext& ctx, const Address& new_owner) {
  ReentrancyLock lock(entered_);
  if (const Result guard = admin_guards(ctx, lock, "transfer_ownership"); !guard.ok) {
    return guard;
  }
  if (new_owner.empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "New owner must not be empty.");
  }

  const Address previous = owner_;
  owner_ = new_owner;
  commit(EventKind::OwnershipTransferred, ctx, {{"previous_owner", previous.value}, {"new_owner", new_owner.value}});
  spdlog::info("ownership moved from {} to {}", previous.value, new_owner.value);
  return Result::success("Ownership transferred.");
}

Result SaleService::on_items_received(const CallContext& ctx, const Address& from, ItemId item,
                                      std::uint64_t amount) {
  if (!started_ || assets_ == nullptr || ctx.caller != assets_->address()) {
    spdlog::warn("item deposit callback from {} refused", ctx.caller.value);
    return Result::failure(ErrorCode::UnauthorizedCallback, "Deposits are accepted from the asset ledger only.");
  }

  // Journal only: deposits change no engine state and may arrive mid-request.
  const std::string event_id = journal_.emit(EventKind::ItemsReceived, ctx.caller, ctx.now,
                                             {{"from", from.value},
                                              {"item", std::to_string(item)},
                                              {"amount", std::to_string(amount)}});
  spdlog::debug("received {} of item {} from {}", amount, item, from.value);
  return Result::success("Deposit accepted.", event_id);
}

std::vector<ItemId> SaleService::active_items() const {
  return registry_.active_items();
}

ActiveSalePage SaleService::active_sales_page(std::size_t offset, std::size_t limit) const {
  const std::vector<ItemId>& all = registry_.active_items();
  ActiveSalePage page;
  page.total = all.size();
  if (offset >= all.size()) {
    return page;
  }

  const std::size_t end = offset + std::min(limit, all.size() - offset);
  for (std::size_t i = offset; i < end; ++i) {
    page.items.push_back(all[i]);
    page.configs.push_back(*registry_.find(all[i]));
  }
  return page;
}

std::vector<ItemId> SaleService::live_items(Timestamp now) const {
  std::vector<ItemId> live;
  for (ItemId item : registry_.active_items()) {
    const SaleConfig& config = *registry_.find(item);
    if (config.in_window(now) && config.remaining() > 0) {
      live.push_back(item);
    }
  }
  return live;
}

SaleSnapshot SaleService::sale(ItemId item) const {
  SaleSnapshot snapshot{.item = item};
  if (const SaleConfig* config = registry_.find(item); config != nullptr) {
    snapshot.config = *config;
    snapshot.indexed = registry_.is_active(item);
  }
  return snapshot;
}

BuyerStatus SaleService::buyer_status(ItemId item, const Address& buyer, Timestamp now) const {
  BuyerStatus status{.item = item, .buyer = buyer};
  const SaleConfig* config = registry_.find(item);
  if (config == nullptr) {
    return status;
  }

  status.sale_version = config->sale_version;
  status.purchased = ledger_.purchased(item, config->sale_version, buyer);
  if (config->max_per_address == 0) {
    status.remaining = config->remaining();
  } else {
    status.remaining = status.purchased >= config->max_per_address ? 0 : config->max_per_address - status.purchased;
  }
  status.eligible =
      registry_.is_active(item) && config->in_window(now) && config->remaining() > 0 && status.remaining > 0;
  return status;
}

bool SaleService::is_active(ItemId item) const {
  return registry_.is_active(item);
}

SupplySnapshot SaleService::remaining_supply(ItemId item) const {
  SupplySnapshot snapshot{.item = item};
  if (const SaleConfig* config = registry_.find(item); config != nullptr) {
    snapshot.max_supply = config->max_supply;
    snapshot.total_sold = config->total_sold;
    snapshot.remaining = config->remaining();
  }
  if (assets_ != nullptr) {
    snapshot.held = assets_->balance_of(config_.engine_account, item);
  }
  return snapshot;
}

std::uint64_t SaleService::withdrawable_items(ItemId item) const {
  if (assets_ == nullptr) {
    return 0;
  }
  return InventoryGuard(registry_, *assets_, config_.engine_account).withdrawable(item);
}

std::optional<Amount> SaleService::quote(ItemId item, Quantity quantity) const {
  const SaleConfig* config = registry_.find(item);
  if (config == nullptr || !config->exists()) {
    return std::nullopt;
  }
  return util::checked_mul<Amount>(config->price, quantity);
}

std::string SaleService::commit(EventKind kind, const CallContext& ctx, util::FieldList fields) {
  std::string event_id = journal_.emit(kind, ctx.caller, ctx.now, std::move(fields));
  persist_state();
  return event_id;
}

void SaleService::persist_state() const {
  if (config_.state_path.empty()) {
    return;
  }
  const StateStore store(config_.state_path);
  const EngineControls controls{
      .owner = owner_,
      .payment_recipient = payment_recipient_,
      .paused = paused_,
  };
  if (const Result saved = store.save(controls, registry_, ledger_); !saved.ok) {
    spdlog::error("state snapshot write failed: {}", saved.message);
  }
}

}  // namespace allot
