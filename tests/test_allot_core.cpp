#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "core/config/engine_config.hpp"
#include "core/journal/event_journal.hpp"
#include "core/ledger/in_memory_ledgers.hpp"
#include "core/service/sale_service.hpp"
#include "core/storage/state_store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/indexed_set.hpp"

namespace {

const allot::Address kOwner{"owner"};
const allot::Address kEngine{"engine"};
const allot::Address kRecipient{"treasury"};
const allot::Address kBuyerA{"buyer-a"};
const allot::Address kBuyerB{"buyer-b"};
const allot::Address kAssetLedger{"asset-ledger"};
const allot::Address kToken{"token-usd"};

struct Harness {
  allot::InMemoryNativeLedger native;
  allot::InMemoryTokenLedger tokens;
  allot::InMemoryAssetLedger assets{kAssetLedger};
  allot::SaleService service;
};

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "allot-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

allot::EngineConfig test_config() {
  allot::EngineConfig config;
  config.owner = kOwner;
  config.engine_account = kEngine;
  config.payment_recipient = kRecipient;
  config.logging.level = "warn";
  return config;
}

allot::EngineConfig persistent_config(const std::filesystem::path& dir) {
  allot::EngineConfig config = test_config();
  config.journal_path = (dir / "journal.log").string();
  config.state_path = (dir / "state.dat").string();
  return config;
}

allot::CallContext as(const allot::Address& caller, allot::Timestamp now = 150, allot::Amount value = 0) {
  return {.caller = caller, .now = now, .value = value};
}

void start(Harness& h, const allot::EngineConfig& config) {
  const allot::Result init = h.service.init(config, h.native, h.tokens);
  assert(init.ok);
  const allot::Result wired = h.service.set_asset_ledger(as(kOwner), &h.assets);
  assert(wired.ok);
}

void mint_items(Harness& h, allot::ItemId item, std::uint64_t amount) {
  const allot::Result minted = h.assets.mint(kEngine, item, amount);
  assert(minted.ok);
}

void fund(Harness& h, const allot::Address& holder, allot::Amount amount) {
  const allot::Result credited = h.native.credit(holder, amount);
  assert(credited.ok);
}

void fund_tokens(Harness& h, const allot::Address& holder, allot::Amount amount) {
  const allot::Result minted = h.tokens.mint(kToken, holder, amount);
  assert(minted.ok);
  h.tokens.approve(kToken, holder, kEngine, amount);
}

allot::SaleDraft native_sale(allot::ItemId item) {
  return {
      .item = item,
      .price = 2,
      .start_time = 100,
      .end_time = 200,
      .max_supply = 10,
      .max_per_address = 3,
  };
}

allot::SaleDraft token_sale(allot::ItemId item) {
  return {
      .item = item,
      .price = 5,
      .start_time = 100,
      .end_time = 200,
      .max_supply = 10,
      .max_per_address = 0,
      .payment_token = kToken,
  };
}

void configure(Harness& h, const allot::SaleDraft& draft) {
  const allot::Result configured = h.service.configure_sale(as(kOwner), draft);
  assert(configured.ok);
}

void check_invariants(const Harness& h) {
  const allot::SaleRegistry& registry = h.service.registry();
  assert(registry.index_consistent());
  for (const auto& [item, config] : registry.configs()) {
    assert(config.total_sold <= config.max_supply);
    if (config.active) {
      assert(config.start_time < config.end_time);
    }
  }
  for (const auto& [key, count] : h.service.ledger().entries()) {
    const allot::SaleConfig* config = registry.find(key.item);
    assert(config != nullptr);
    if (key.sale_version == config->sale_version && config->max_per_address > 0) {
      assert(count <= config->max_per_address);
    }
  }
  assert(h.native.balance_of(kEngine) == 0);
}

void test_indexed_set_swap_remove() {
  allot::util::IndexedSet<allot::ItemId> set;
  assert(set.insert(1));
  assert(set.insert(2));
  assert(set.insert(3));
  assert(set.insert(4));
  assert(!set.insert(3));
  assert(set.size() == 4U);

  assert(set.erase(2));
  assert((set.items() == std::vector<allot::ItemId>{1, 4, 3}));
  assert(!set.contains(2));
  assert(set.contains(4));
  assert(!set.erase(2));

  assert(set.erase(3));
  assert((set.items() == std::vector<allot::ItemId>{1, 4}));
  assert(set.insert(2));
  assert((set.items() == std::vector<allot::ItemId>{1, 4, 2}));
}

void test_single_purchase_and_quota() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);

  const allot::Result configured = h.service.configure_sale(as(kOwner), native_sale(7));
  assert(configured.ok);
  assert(configured.data == "1");
  assert(h.service.is_active(7));

  fund(h, kBuyerA, 8);
  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 6), 7, 3);
  assert(bought.ok);
  assert(bought.data.size() == 64U);
  assert(h.service.sale(7).config.total_sold == 3U);
  assert(h.native.balance_of(kRecipient) == 6U);
  assert(h.native.balance_of(kBuyerA) == 2U);
  assert(h.assets.balance_of(kBuyerA, 7) == 3U);
  assert(h.assets.balance_of(kEngine, 7) == 7U);
  assert(h.assets.transfer_calls() == 1U);
  assert(h.assets.batch_transfer_calls() == 0U);

  const allot::BuyerStatus status = h.service.buyer_status(7, kBuyerA, 150);
  assert(status.sale_version == 1U);
  assert(status.purchased == 3U);
  assert(status.remaining == 0U);
  assert(!status.eligible);

  const allot::Result over_quota = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(!over_quota.ok);
  assert(over_quota.code == allot::ErrorCode::ExceedsMaxPerAddress);
  assert(h.native.balance_of(kBuyerA) == 2U);
  assert(h.service.sale(7).config.total_sold == 3U);

  const allot::Result zero = h.service.purchase(as(kBuyerB, 150, 0), 7, 0);
  assert(zero.code == allot::ErrorCode::ZeroAmount);

  assert(h.service.journal().events_of(allot::EventKind::PurchaseCompleted).size() == 1U);
  check_invariants(h);
}

void test_native_refund_of_excess() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);
  configure(h, native_sale(7));

  fund(h, kBuyerB, 10);
  const allot::Result bought = h.service.purchase(as(kBuyerB, 150, 10), 7, 3);
  assert(bought.ok);
  assert(h.native.balance_of(kBuyerB) == 4U);
  assert(h.native.balance_of(kRecipient) == 6U);
  assert(h.service.last_receipt().native_charged == 6U);
  assert(h.service.last_receipt().native_refunded == 4U);
  assert(h.service.last_receipt().event_id == bought.data);

  const allot::Result short_paid = h.service.purchase(as(kBuyerA, 150, 1), 7, 1);
  assert(short_paid.code == allot::ErrorCode::InsufficientPayment);

  // Tender the caller cannot actually fund.
  const allot::Result unfunded = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(unfunded.code == allot::ErrorCode::InsufficientPayment);
  assert(h.service.sale(7).config.total_sold == 3U);
  check_invariants(h);
}

void test_duplicate_and_shape_rejections() {
  Harness h;
  allot::EngineConfig config = test_config();
  config.max_batch_size = 2;
  start(h, config);
  mint_items(h, 7, 10);
  mint_items(h, 8, 10);
  configure(h, native_sale(7));
  configure(h, native_sale(8));
  fund(h, kBuyerA, 100);

  const allot::Result duplicate = h.service.purchase_batch(as(kBuyerA, 150, 4), {7, 7}, {1, 1});
  assert(duplicate.code == allot::ErrorCode::DuplicateItem);
  const allot::Result duplicate_aggregated = h.service.purchase_batch_aggregated(as(kBuyerA, 150, 4), {7, 7}, {1, 1});
  assert(duplicate_aggregated.code == allot::ErrorCode::DuplicateItem);

  const allot::Result mismatch = h.service.purchase_batch(as(kBuyerA, 150, 4), {7, 8}, {1});
  assert(mismatch.code == allot::ErrorCode::ArrayLengthMismatch);
  const allot::Result zero_entry = h.service.purchase_batch(as(kBuyerA, 150, 4), {7, 8}, {1, 0});
  assert(zero_entry.code == allot::ErrorCode::ZeroAmount);
  const allot::Result empty = h.service.purchase_batch(as(kBuyerA, 150, 0), {}, {});
  assert(empty.code == allot::ErrorCode::ZeroAmount);
  const allot::Result too_large = h.service.purchase_batch(as(kBuyerA, 150, 6), {7, 8, 9}, {1, 1, 1});
  assert(too_large.code == allot::ErrorCode::BatchTooLarge);

  assert(h.service.sale(7).config.total_sold == 0U);
  assert(h.service.sale(8).config.total_sold == 0U);
  assert(h.service.ledger().entries().empty());
  assert(h.native.balance_of(kBuyerA) == 100U);
  assert(h.native.transfer_calls() == 0U);
  assert(h.assets.batch_transfer_calls() == 0U);
}

void test_reconfigure_resets_quota() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 20);
  configure(h, native_sale(7));
  fund(h, kBuyerA, 6);

  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 6), 7, 3);
  assert(bought.ok);

  const allot::Result while_active = h.service.configure_sale(as(kOwner), native_sale(7));
  assert(while_active.code == allot::ErrorCode::SaleMustBeInactive);

  const allot::Result stopped = h.service.set_sale_active(as(kOwner), 7, false);
  assert(stopped.ok);
  assert(!h.service.is_active(7));
  assert(h.service.active_items().empty());

  const allot::Result reconfigured = h.service.configure_sale(as(kOwner), native_sale(7));
  assert(reconfigured.ok);
  assert(reconfigured.data == "2");

  const allot::SaleSnapshot snapshot = h.service.sale(7);
  assert(snapshot.config.sale_version == 2U);
  assert(snapshot.config.total_sold == 0U);
  assert(snapshot.indexed);

  const allot::BuyerStatus status = h.service.buyer_status(7, kBuyerA, 150);
  assert(status.sale_version == 2U);
  assert(status.purchased == 0U);
  assert(status.remaining == 3U);
  assert(status.eligible);
  assert(h.service.ledger().purchased(7, 1, kBuyerA) == 3U);
  check_invariants(h);
}

void test_aggregated_token_batch_single_pull() {
  Harness h;
  start(h, test_config());
  for (allot::ItemId item : {1, 2, 3}) {
    mint_items(h, item, 10);
    configure(h, token_sale(item));
  }
  fund_tokens(h, kBuyerA, 30);

  const allot::Result bought = h.service.purchase_batch_aggregated(as(kBuyerA), {1, 2, 3}, {2, 3, 1});
  assert(bought.ok);
  assert(h.tokens.pull_calls() == 1U);
  assert(h.tokens.pulls().size() == 1U);
  assert(h.tokens.pulls().front().first == kToken);
  assert(h.tokens.pulls().front().second == 30U);
  assert(h.tokens.balance_of(kToken, kRecipient) == 30U);
  assert(h.tokens.balance_of(kToken, kBuyerA) == 0U);
  assert(h.assets.batch_transfer_calls() == 1U);
  assert(h.assets.balance_of(kBuyerA, 1) == 2U);
  assert(h.assets.balance_of(kBuyerA, 2) == 3U);
  assert(h.assets.balance_of(kBuyerA, 3) == 1U);
  assert(h.service.last_receipt().token_pulls == 1U);
  assert(h.service.last_receipt().lines.size() == 3U);
  check_invariants(h);
}

void test_per_item_token_batch_pulls_each_entry() {
  Harness h;
  start(h, test_config());
  for (allot::ItemId item : {1, 2, 3}) {
    mint_items(h, item, 10);
    configure(h, token_sale(item));
  }
  fund_tokens(h, kBuyerA, 30);

  const allot::Result bought = h.service.purchase_batch(as(kBuyerA), {1, 2, 3}, {2, 3, 1});
  assert(bought.ok);
  assert(h.tokens.pull_calls() == 3U);
  assert(h.tokens.pulls()[0].second == 10U);
  assert(h.tokens.pulls()[1].second == 15U);
  assert(h.tokens.pulls()[2].second == 5U);
  assert(h.tokens.balance_of(kToken, kRecipient) == 30U);
  assert(h.assets.batch_transfer_calls() == 1U);
  check_invariants(h);
}

void test_batch_is_all_or_nothing() {
  Harness h;
  start(h, test_config());
  mint_items(h, 1, 10);
  configure(h, token_sale(1));
  fund_tokens(h, kBuyerA, 100);

  // Item 2 has no sale: the whole batch fails and item 1 is left untouched.
  const allot::Result per_item = h.service.purchase_batch(as(kBuyerA), {1, 2}, {2, 1});
  assert(per_item.code == allot::ErrorCode::SaleNotActive);
  const allot::Result aggregated = h.service.purchase_batch_aggregated(as(kBuyerA), {1, 2}, {2, 1});
  assert(aggregated.code == allot::ErrorCode::SaleNotActive);

  assert(h.service.sale(1).config.total_sold == 0U);
  assert(h.service.ledger().entries().empty());
  assert(h.tokens.pull_calls() == 0U);
  assert(h.tokens.balance_of(kToken, kBuyerA) == 100U);
  assert(h.service.journal().events_of(allot::EventKind::PurchaseCompleted).empty());

  // Allowance below the batch total is caught before the first pull.
  h.tokens.approve(kToken, kBuyerA, kEngine, 14);
  mint_items(h, 2, 10);
  configure(h, token_sale(2));
  const allot::Result short_allowance = h.service.purchase_batch(as(kBuyerA), {1, 2}, {2, 1});
  assert(short_allowance.code == allot::ErrorCode::InsufficientPayment);
  assert(h.tokens.pull_calls() == 0U);
  assert(h.service.sale(1).config.total_sold == 0U);
  check_invariants(h);
}

void test_stray_native_currency_rejected() {
  Harness h;
  start(h, test_config());
  mint_items(h, 1, 10);
  configure(h, token_sale(1));
  fund_tokens(h, kBuyerA, 50);
  fund(h, kBuyerA, 5);

  const allot::Result stray = h.service.purchase(as(kBuyerA, 150, 5), 1, 1);
  assert(stray.code == allot::ErrorCode::InvalidPaymentCurrency);
  assert(h.native.balance_of(kBuyerA) == 5U);
  assert(h.tokens.pull_calls() == 0U);

  const allot::Result paid = h.service.purchase(as(kBuyerA, 150, 0), 1, 1);
  assert(paid.ok);
  assert(h.tokens.balance_of(kToken, kRecipient) == 5U);
}

void test_supply_and_window_boundaries() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);
  mint_items(h, 8, 10);
  allot::SaleDraft open = native_sale(7);
  open.max_per_address = 0;
  configure(h, open);
  configure(h, native_sale(8));
  fund(h, kBuyerA, 1000);

  const allot::Result at_start = h.service.purchase(as(kBuyerA, 100, 20), 7, 10);
  assert(at_start.ok);
  assert(h.service.sale(7).config.total_sold == 10U);
  assert(h.service.remaining_supply(7).remaining == 0U);

  const allot::Result one_more = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(one_more.code == allot::ErrorCode::ExceedsMaxSupply);

  const allot::Result too_early = h.service.purchase(as(kBuyerA, 99, 2), 8, 1);
  assert(too_early.code == allot::ErrorCode::SaleNotActive);
  const allot::Result too_late = h.service.purchase(as(kBuyerA, 201, 2), 8, 1);
  assert(too_late.code == allot::ErrorCode::SaleNotActive);
  const allot::Result at_end = h.service.purchase(as(kBuyerA, 200, 2), 8, 1);
  assert(at_end.ok);

  assert((h.service.live_items(150) == std::vector<allot::ItemId>{8}));
  assert(h.service.live_items(201).empty());
  check_invariants(h);
}

void test_admission_inventory_and_overflow() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 2);

  allot::SaleDraft verified = native_sale(7);
  verified.verify_inventory = true;
  const allot::Result unbacked = h.service.configure_sale(as(kOwner), verified);
  assert(unbacked.code == allot::ErrorCode::InsufficientInventory);

  configure(h, native_sale(7));
  fund(h, kBuyerA, 100);
  const allot::Result short_stock = h.service.purchase(as(kBuyerA, 150, 6), 7, 3);
  assert(short_stock.code == allot::ErrorCode::InsufficientInventory);

  allot::SaleDraft pricey = native_sale(9);
  pricey.price = std::numeric_limits<allot::Amount>::max();
  mint_items(h, 9, 10);
  configure(h, pricey);
  const allot::Result overflow = h.service.purchase(as(kBuyerA, 150, 0), 9, 2);
  assert(overflow.code == allot::ErrorCode::ArithmeticOverflow);
  assert(!h.service.quote(9, 2).has_value());
  assert(h.service.quote(9, 1) == std::optional<allot::Amount>{std::numeric_limits<allot::Amount>::max()});
  assert(h.service.quote(7, 3) == std::optional<allot::Amount>{6});
  assert(!h.service.quote(42, 1).has_value());
  assert(h.service.sale(9).config.total_sold == 0U);
}

void test_sale_parameter_validation() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);

  allot::SaleDraft bad = native_sale(7);
  bad.price = 0;
  assert(h.service.configure_sale(as(kOwner), bad).code == allot::ErrorCode::ZeroAmount);
  bad = native_sale(7);
  bad.max_supply = 0;
  assert(h.service.configure_sale(as(kOwner), bad).code == allot::ErrorCode::ZeroAmount);
  bad = native_sale(7);
  bad.start_time = 200;
  assert(h.service.configure_sale(as(kOwner), bad).code == allot::ErrorCode::InvalidTimeRange);
  assert(!h.service.sale(7).config.exists());

  assert(h.service.update_sale_params(as(kOwner), 7, 3, 300).code == allot::ErrorCode::SaleNotFound);
  assert(h.service.set_sale_active(as(kOwner), 7, true).code == allot::ErrorCode::SaleNotFound);

  configure(h, native_sale(7));
  assert(h.service.update_sale_params(as(kOwner), 7, 0, 300).code == allot::ErrorCode::ZeroAmount);
  assert(h.service.update_sale_params(as(kOwner), 7, 3, 199).code == allot::ErrorCode::InvalidTimeRange);

  fund(h, kBuyerA, 4);
  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 4), 7, 2);
  assert(bought.ok);

  const allot::Result extended = h.service.update_sale_params(as(kOwner), 7, 3, 300);
  assert(extended.ok);
  const allot::SaleConfig config = h.service.sale(7).config;
  assert(config.price == 3U);
  assert(config.end_time == 300U);
  assert(config.total_sold == 2U);
  assert(config.sale_version == 1U);
  assert(config.active);

  const allot::Result stopped = h.service.set_sale_active(as(kOwner, 350), 7, false);
  assert(stopped.ok);
  const allot::Result expired = h.service.set_sale_active(as(kOwner, 350), 7, true);
  assert(expired.code == allot::ErrorCode::InvalidTimeRange);
  assert(!h.service.is_active(7));

  const allot::Result resumed = h.service.set_sale_active(as(kOwner, 250), 7, true);
  assert(resumed.ok);
  assert(h.service.is_active(7));
  check_invariants(h);
}

void test_reentrant_calls_rejected() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);
  configure(h, native_sale(7));
  fund(h, kBuyerA, 2);
  fund(h, kBuyerB, 2);

  allot::Result nested_purchase;
  allot::Result nested_admin;
  bool fired = false;
  h.native.set_transfer_hook([&](const allot::Address&, const allot::Address&) {
    if (fired) {
      return;
    }
    fired = true;
    nested_purchase = h.service.purchase(as(kBuyerB, 150, 2), 7, 1);
  });
  h.assets.set_transfer_hook([&](const allot::Address&, const allot::Address&) {
    nested_admin = h.service.set_paused(as(kOwner), true);
  });

  const allot::Result outer = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(outer.ok);
  assert(fired);
  assert(nested_purchase.code == allot::ErrorCode::ReentrantCall);
  assert(nested_admin.code == allot::ErrorCode::ReentrantCall);
  assert(!h.service.paused());
  assert(h.service.sale(7).config.total_sold == 1U);

  // The lock is released once the outer request returns.
  h.assets.set_transfer_hook({});
  const allot::Result after = h.service.purchase(as(kBuyerB, 150, 2), 7, 1);
  assert(after.ok);
  assert(h.service.sale(7).config.total_sold == 2U);
  check_invariants(h);
}

void test_failed_delivery_reverts_bookkeeping() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);
  configure(h, native_sale(7));
  fund(h, kBuyerA, 6);

  h.assets.set_fail_transfers(true);
  const allot::Result failed = h.service.purchase(as(kBuyerA, 150, 6), 7, 3);
  assert(failed.code == allot::ErrorCode::TransferFailed);
  assert(h.service.sale(7).config.total_sold == 0U);
  assert(h.service.ledger().entries().empty());
  assert(h.service.journal().events_of(allot::EventKind::PurchaseCompleted).empty());
  assert(h.assets.balance_of(kEngine, 7) == 10U);
  assert(h.assets.balance_of(kBuyerA, 7) == 0U);
  assert(h.native.balance_of(kBuyerA) == 6U);
  assert(h.native.balance_of(kRecipient) == 0U);
  check_invariants(h);

  h.assets.set_fail_transfers(false);
  const allot::Result retried = h.service.purchase(as(kBuyerA, 150, 6), 7, 3);
  assert(retried.ok);
  assert(h.native.balance_of(kBuyerA) == 0U);
  assert(h.native.balance_of(kRecipient) == 6U);
  check_invariants(h);
}

void test_failed_delivery_returns_token_payment() {
  Harness h;
  start(h, test_config());
  for (allot::ItemId item : {1, 2}) {
    mint_items(h, item, 10);
    configure(h, token_sale(item));
  }
  fund_tokens(h, kBuyerA, 25);

  h.assets.set_fail_transfers(true);
  const allot::Result failed = h.service.purchase_batch_aggregated(as(kBuyerA), {1, 2}, {2, 3});
  assert(failed.code == allot::ErrorCode::TransferFailed);
  assert(h.tokens.pull_calls() == 1U);
  assert(h.tokens.balance_of(kToken, kBuyerA) == 25U);
  assert(h.tokens.balance_of(kToken, kRecipient) == 0U);
  assert(h.tokens.balance_of(kToken, kEngine) == 0U);
  assert(h.service.sale(1).config.total_sold == 0U);
  assert(h.service.sale(2).config.total_sold == 0U);
  assert(h.service.ledger().entries().empty());
  check_invariants(h);
}

void test_failed_later_pull_returns_earlier_pulls() {
  Harness h;
  start(h, test_config());
  for (allot::ItemId item : {1, 2}) {
    mint_items(h, item, 10);
    configure(h, token_sale(item));
  }
  fund_tokens(h, kBuyerA, 25);

  // After the first pull the buyer spends one token elsewhere, so the second pull bounces.
  bool drained = false;
  h.tokens.set_transfer_hook([&](const allot::Address&, const allot::Address& to) {
    if (drained || to != kEngine) {
      return;
    }
    drained = true;
    const allot::Result spent = h.tokens.transfer(kToken, kBuyerA, kBuyerB, 1);
    assert(spent.ok);
  });

  const allot::Result failed = h.service.purchase_batch(as(kBuyerA), {1, 2}, {2, 3});
  assert(failed.code == allot::ErrorCode::TransferFailed);
  assert(drained);
  assert(h.tokens.pull_calls() == 2U);
  assert(h.tokens.balance_of(kToken, kBuyerA) == 24U);
  assert(h.tokens.balance_of(kToken, kBuyerB) == 1U);
  assert(h.tokens.balance_of(kToken, kRecipient) == 0U);
  assert(h.tokens.balance_of(kToken, kEngine) == 0U);
  assert(h.assets.batch_transfer_calls() == 0U);
  assert(h.assets.balance_of(kEngine, 1) == 10U);
  assert(h.service.sale(1).config.total_sold == 0U);
  assert(h.service.ledger().entries().empty());
  check_invariants(h);
}

void test_reactivation_requires_held_inventory() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);
  configure(h, native_sale(7));
  fund(h, kBuyerA, 4);

  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 4), 7, 2);
  assert(bought.ok);
  const allot::Result stopped = h.service.set_sale_active(as(kOwner), 7, false);
  assert(stopped.ok);
  const allot::Result pulled = h.service.withdraw_items(as(kOwner), {7}, {3});
  assert(pulled.ok);
  assert(h.service.remaining_supply(7).held == 5U);

  const allot::Result short_stock = h.service.set_sale_active(as(kOwner), 7, true);
  assert(short_stock.code == allot::ErrorCode::InsufficientInventory);
  assert(!h.service.is_active(7));
  assert(h.service.active_items().empty());

  mint_items(h, 7, 3);
  const allot::Result restocked = h.service.set_sale_active(as(kOwner), 7, true);
  assert(restocked.ok);
  assert(h.service.is_active(7));
  assert((h.service.active_items() == std::vector<allot::ItemId>{7}));
  check_invariants(h);

  allot::SaleRegistry registry;
  allot::SaleDraft verified = native_sale(9);
  verified.verify_inventory = true;
  const allot::Result configured = registry.configure(verified, &h.assets, kEngine);
  assert(configured.code == allot::ErrorCode::InsufficientInventory);
  mint_items(h, 9, 10);
  assert(registry.configure(verified, &h.assets, kEngine).ok);
  assert(registry.set_active(9, false, 150, nullptr, kEngine).ok);
  const allot::Result unwired = registry.set_active(9, true, 150, nullptr, kEngine);
  assert(unwired.code == allot::ErrorCode::NotInitialized);
  assert(registry.active_items().empty());
  assert(registry.index_consistent());
}

void test_pause_owner_and_initialization_guards() {
  Harness h;
  const allot::Result early = h.service.set_paused(as(kOwner), true);
  assert(early.code == allot::ErrorCode::NotInitialized);

  allot::EngineConfig config = test_config();
  config.payment_recipient = {};
  const allot::Result init = h.service.init(config, h.native, h.tokens);
  assert(init.ok);
  mint_items(h, 7, 10);
  fund(h, kBuyerA, 10);

  const allot::Result no_assets = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(no_assets.code == allot::ErrorCode::NotInitialized);
  assert(h.service.set_asset_ledger(as(kOwner), nullptr).code == allot::ErrorCode::InvalidAddress);
  assert(h.service.set_asset_ledger(as(kBuyerA), &h.assets).code == allot::ErrorCode::NotOwner);
  const allot::Result wired = h.service.set_asset_ledger(as(kOwner), &h.assets);
  assert(wired.ok);
  configure(h, native_sale(7));

  const allot::Result no_recipient = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(no_recipient.code == allot::ErrorCode::NotInitialized);
  assert(h.service.set_payment_recipient(as(kOwner), {}).code == allot::ErrorCode::InvalidAddress);
  const allot::Result recipient = h.service.set_payment_recipient(as(kOwner), kRecipient);
  assert(recipient.ok);

  assert(h.service.set_paused(as(kBuyerA), true).code == allot::ErrorCode::NotOwner);
  assert(h.service.configure_sale(as(kBuyerA), native_sale(8)).code == allot::ErrorCode::NotOwner);
  const allot::Result paused = h.service.set_paused(as(kOwner), true);
  assert(paused.ok);
  const allot::Result while_paused = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(while_paused.code == allot::ErrorCode::Paused);

  const allot::Result resumed = h.service.set_paused(as(kOwner), false);
  assert(resumed.ok);
  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(bought.ok);

  assert(h.service.transfer_ownership(as(kOwner), {}).code == allot::ErrorCode::InvalidAddress);
  const allot::Result handed = h.service.transfer_ownership(as(kOwner), kBuyerB);
  assert(handed.ok);
  assert(h.service.owner() == kBuyerB);
  assert(h.service.set_paused(as(kOwner), true).code == allot::ErrorCode::NotOwner);
  const allot::Result new_owner = h.service.set_paused(as(kBuyerB), true);
  assert(new_owner.ok);
  assert(h.service.journal().events_of(allot::EventKind::OwnershipTransferred).size() == 1U);
}

void test_deposit_callback_authorization() {
  Harness h;
  start(h, test_config());

  const allot::Result spoofed = h.service.on_items_received(as(kBuyerA), kBuyerA, 7, 5);
  assert(spoofed.code == allot::ErrorCode::UnauthorizedCallback);

  const allot::Result accepted = h.service.on_items_received(as(kAssetLedger), kBuyerA, 7, 5);
  assert(accepted.ok);
  const auto received = h.service.journal().events_of(allot::EventKind::ItemsReceived);
  assert(received.size() == 1U);
  const auto fields = allot::util::parse_canonical_map(received.front().payload);
  assert(fields.at("item") == "7");
  assert(fields.at("amount") == "5");
  assert(fields.at("from") == kBuyerA.value);
}

void test_inventory_guard_withdrawals() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 15);
  allot::SaleDraft draft = native_sale(7);
  draft.max_per_address = 0;
  configure(h, draft);
  fund(h, kBuyerA, 8);

  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 8), 7, 4);
  assert(bought.ok);
  assert(h.service.withdrawable_items(7) == 5U);

  const allot::Result too_much = h.service.withdraw_items(as(kOwner), {7}, {6});
  assert(too_much.code == allot::ErrorCode::ActiveSaleInventoryRequired);
  assert(h.service.withdraw_items(as(kBuyerA), {7}, {1}).code == allot::ErrorCode::NotOwner);
  assert(h.service.withdraw_items(as(kOwner), {7, 7}, {1, 1}).code == allot::ErrorCode::DuplicateItem);
  assert(h.service.withdraw_items(as(kOwner), {7}, {0}).code == allot::ErrorCode::ZeroAmount);

  const allot::Result surplus = h.service.withdraw_items(as(kOwner), {7}, {5});
  assert(surplus.ok);
  assert(h.assets.balance_of(kOwner, 7) == 5U);
  assert(h.assets.balance_of(kEngine, 7) == 6U);
  assert(h.service.withdrawable_items(7) == 0U);

  // Inactive sales reserve nothing.
  const allot::Result stopped = h.service.set_sale_active(as(kOwner), 7, false);
  assert(stopped.ok);
  assert(h.service.withdrawable_items(7) == 6U);
  const allot::Result rest = h.service.withdraw_items(as(kOwner), {7}, {6});
  assert(rest.ok);
  assert(h.assets.balance_of(kEngine, 7) == 0U);
}

void test_native_and_token_withdrawals() {
  Harness h;
  start(h, test_config());

  const allot::Result empty_native = h.service.withdraw_native_balance(as(kOwner));
  assert(empty_native.code == allot::ErrorCode::NothingToWithdraw);
  fund(h, kEngine, 7);
  const allot::Result native = h.service.withdraw_native_balance(as(kOwner));
  assert(native.ok);
  assert(native.data == "7");
  assert(h.native.balance_of(kOwner) == 7U);
  assert(h.native.balance_of(kEngine) == 0U);

  assert(h.service.withdraw_token_balance(as(kOwner), {}).code == allot::ErrorCode::InvalidAddress);
  assert(h.service.withdraw_token_balance(as(kOwner), kToken).code == allot::ErrorCode::NothingToWithdraw);
  const allot::Result minted = h.tokens.mint(kToken, kEngine, 9);
  assert(minted.ok);
  assert(h.service.withdraw_token_balance(as(kBuyerA), kToken).code == allot::ErrorCode::NotOwner);
  const allot::Result token = h.service.withdraw_token_balance(as(kOwner), kToken);
  assert(token.ok);
  assert(h.tokens.balance_of(kToken, kOwner) == 9U);
  assert(h.service.journal().events_of(allot::EventKind::NativeWithdrawn).size() == 1U);
  assert(h.service.journal().events_of(allot::EventKind::TokenWithdrawn).size() == 1U);
}

void test_active_sale_pagination() {
  Harness h;
  start(h, test_config());
  for (allot::ItemId item = 1; item <= 5; ++item) {
    configure(h, native_sale(item));
  }
  const allot::Result stopped = h.service.set_sale_active(as(kOwner), 2, false);
  assert(stopped.ok);

  assert((h.service.active_items() == std::vector<allot::ItemId>{1, 5, 3, 4}));

  const allot::ActiveSalePage page = h.service.active_sales_page(1, 2);
  assert(page.total == 4U);
  assert((page.items == std::vector<allot::ItemId>{5, 3}));
  assert(page.configs.size() == 2U);
  assert(page.configs.front().price == 2U);

  const allot::ActiveSalePage tail = h.service.active_sales_page(3, 10);
  assert((tail.items == std::vector<allot::ItemId>{4}));
  const allot::ActiveSalePage past = h.service.active_sales_page(10, 2);
  assert(past.items.empty());
  assert(past.total == 4U);

  assert(!h.service.sale(2).indexed);
  assert(h.service.sale(2).config.exists());
  check_invariants(h);
}

void test_state_and_journal_survive_restart() {
  const auto dir = temp_dir("restart");
  std::size_t events_before = 0;
  std::string purchase_id;
  {
    Harness h;
    start(h, persistent_config(dir));
    mint_items(h, 7, 10);
    configure(h, native_sale(7));
    fund(h, kBuyerA, 4);
    const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 4), 7, 2);
    assert(bought.ok);
    purchase_id = bought.data;
    events_before = h.service.journal().events().size();
    assert(events_before == 3U);
  }

  Harness h;
  const allot::Result init = h.service.init(persistent_config(dir), h.native, h.tokens);
  assert(init.ok);
  assert(h.service.journal().events().size() == events_before);
  assert(h.service.journal().skipped_lines() == 0U);
  const auto purchases = h.service.journal().events_of(allot::EventKind::PurchaseCompleted);
  assert(purchases.size() == 1U);
  assert(purchases.front().event_id == purchase_id);
  assert(purchases.front().event_id == allot::util::content_id(purchases.front().payload));

  const allot::SaleSnapshot snapshot = h.service.sale(7);
  assert(snapshot.config.total_sold == 2U);
  assert(snapshot.config.sale_version == 1U);
  assert(snapshot.indexed);
  assert(h.service.ledger().purchased(7, 1, kBuyerA) == 2U);
  assert(h.service.registry().index_consistent());
}

void test_admin_controls_survive_restart() {
  const auto dir = temp_dir("controls");
  const allot::Address new_recipient{"treasury-2"};
  {
    Harness h;
    start(h, persistent_config(dir));
    mint_items(h, 7, 10);
    configure(h, native_sale(7));
    const allot::Result handed = h.service.transfer_ownership(as(kOwner), kBuyerB);
    assert(handed.ok);
    const allot::Result moved = h.service.set_payment_recipient(as(kBuyerB), new_recipient);
    assert(moved.ok);
    const allot::Result paused = h.service.set_paused(as(kBuyerB), true);
    assert(paused.ok);
  }

  Harness h;
  const allot::Result init = h.service.init(persistent_config(dir), h.native, h.tokens);
  assert(init.ok);
  assert(h.service.owner() == kBuyerB);
  assert(h.service.payment_recipient() == new_recipient);
  assert(h.service.paused());
  assert(h.service.set_paused(as(kOwner), false).code == allot::ErrorCode::NotOwner);
  assert(h.service.set_asset_ledger(as(kBuyerB), &h.assets).ok);
  fund(h, kBuyerA, 2);
  assert(h.service.purchase(as(kBuyerA, 150, 2), 7, 1).code == allot::ErrorCode::Paused);

  const allot::Result resumed = h.service.set_paused(as(kBuyerB), false);
  assert(resumed.ok);
  mint_items(h, 7, 10);
  const allot::Result bought = h.service.purchase(as(kBuyerA, 150, 2), 7, 1);
  assert(bought.ok);
  assert(h.native.balance_of(new_recipient) == 2U);
}

void test_corrupt_snapshot_rejected() {
  const auto dir = temp_dir("corrupt");
  const allot::EngineConfig config = persistent_config(dir);
  {
    std::ofstream out(config.state_path);
    out << "# allot sale state v1\n";
    out << "sale\t7\t2\t100\t200\t10\t0\t11\t\t1\t1\n";
    out << "index\t7\n";
  }

  Harness h;
  const allot::Result init = h.service.init(config, h.native, h.tokens);
  assert(!init.ok);
  assert(init.code == allot::ErrorCode::StorageFailure);

  {
    std::ofstream out(config.state_path, std::ios::trunc);
    out << "sale\t7\t2\t100\t200\t10\t0\t3\t\t1\t1\n";
    out << "index\t7\n";
    out << "index\t7\n";
  }
  std::optional<allot::EngineControls> controls;
  allot::SaleRegistry registry;
  allot::PurchaseLedger ledger;
  const allot::StateStore store(config.state_path);
  const allot::Result twice = store.load(controls, registry, ledger);
  assert(twice.code == allot::ErrorCode::StorageFailure);
  assert(registry.configs().empty());

  {
    std::ofstream out(config.state_path, std::ios::trunc);
    out << "sale\t7\t2\t100\t200\t10\t0\t3\t\t1\t1\n";
  }
  const allot::Result unindexed = store.load(controls, registry, ledger);
  assert(unindexed.code == allot::ErrorCode::StorageFailure);

  {
    std::ofstream out(config.state_path, std::ios::trunc);
    out << "sale\t7\t2\t100\t200\t10\t0\t3\t" << allot::util::to_hex(kToken.value) << "\t1\t1\n";
    out << "index\t7\n";
    out << "quota\t7\t1\t" << allot::util::to_hex(kBuyerA.value) << "\t3\n";
  }
  const allot::Result valid = store.load(controls, registry, ledger);
  assert(valid.ok);
  assert(!controls.has_value());
  assert(registry.find(7)->payment_token == kToken);
  assert(ledger.purchased(7, 1, kBuyerA) == 3U);

  {
    std::ofstream out(config.state_path, std::ios::trunc);
    out << "engine\t\t" << allot::util::to_hex(kRecipient.value) << "\t0\n";
  }
  const allot::Result ownerless = store.load(controls, registry, ledger);
  assert(ownerless.code == allot::ErrorCode::StorageFailure);

  {
    std::ofstream out(config.state_path, std::ios::trunc);
    out << "engine\t" << allot::util::to_hex(kBuyerB.value) << "\t\t1\n";
  }
  const allot::Result with_controls = store.load(controls, registry, ledger);
  assert(with_controls.ok);
  assert(controls.has_value());
  assert(controls->owner == kBuyerB);
  assert(controls->payment_recipient.empty());
  assert(controls->paused);
  assert(registry.configs().empty());
}

void test_journal_content_ids_and_reload() {
  assert(allot::util::ensure_sodium());
  const std::string id_a = allot::util::content_id("allot");
  const std::string id_b = allot::util::content_id("allot");
  assert(id_a == id_b);
  assert(id_a.size() == 64U);
  assert(id_a != allot::util::content_id("allot!"));

  const auto dir = temp_dir("journal");
  const std::string path = (dir / "journal.log").string();
  std::string first_id;
  {
    allot::EventJournal journal;
    const allot::Result opened = journal.open(path);
    assert(opened.ok);
    first_id = journal.emit(allot::EventKind::PauseToggled, kOwner, 10, {{"paused", "1"}});
    const std::string second_id = journal.emit(allot::EventKind::PauseToggled, kOwner, 10, {{"paused", "1"}});
    assert(first_id != second_id);
  }
  {
    std::ofstream out(path, std::ios::app);
    out << "not-a-journal-line\n";
  }

  allot::EventJournal reloaded;
  const allot::Result opened = reloaded.open(path);
  assert(opened.ok);
  assert(reloaded.events().size() == 2U);
  assert(reloaded.skipped_lines() == 1U);
  assert(reloaded.events().front().event_id == first_id);
  assert(reloaded.events().front().actor == kOwner.value);
  const auto fields = allot::util::parse_canonical_map(reloaded.events().front().payload);
  assert(fields.at("kind") == "PauseToggled");
  assert(fields.at("paused") == "1");
}

void test_engine_config_file() {
  const auto dir = temp_dir("config");
  const std::string path = (dir / "engine.conf").string();

  allot::EngineConfig written = test_config();
  written.max_batch_size = 12;
  written.journal_path = (dir / "journal.log").string();
  written.logging.level = "debug";
  const allot::Result saved = allot::write_engine_config(path, written);
  assert(saved.ok);

  allot::EngineConfig loaded;
  const allot::Result read = allot::load_engine_config(path, loaded);
  assert(read.ok);
  assert(loaded.owner == kOwner);
  assert(loaded.engine_account == kEngine);
  assert(loaded.payment_recipient == kRecipient);
  assert(loaded.max_batch_size == 12U);
  assert(loaded.journal_path == written.journal_path);
  assert(loaded.state_path.empty());
  assert(loaded.logging.level == "debug");

  {
    std::ofstream out(path, std::ios::trunc);
    out << "# hand edited\n";
    out << "owner = someone\n";
    out << "engine_account=vault\n";
    out << "max_batch_size=0\n";
  }
  allot::EngineConfig rejected;
  assert(allot::load_engine_config(path, rejected).code == allot::ErrorCode::InvalidConfig);
  assert(rejected.owner.empty());
  assert(allot::load_engine_config((dir / "missing.conf").string(), rejected).code ==
         allot::ErrorCode::InvalidConfig);

  allot::EngineConfig no_owner = test_config();
  no_owner.owner = {};
  assert(allot::validate_engine_config(no_owner).code == allot::ErrorCode::InvalidConfig);
  allot::EngineConfig huge_batch = test_config();
  huge_batch.max_batch_size = 257;
  assert(allot::validate_engine_config(huge_batch).code == allot::ErrorCode::InvalidConfig);

  Harness h;
  assert(h.service.init(no_owner, h.native, h.tokens).code == allot::ErrorCode::InvalidConfig);
}

void test_held_inventory_tracks_sales() {
  Harness h;
  start(h, test_config());
  mint_items(h, 7, 10);
  mint_items(h, 8, 10);
  configure(h, native_sale(7));
  configure(h, native_sale(8));
  fund(h, kBuyerA, 100);
  fund(h, kBuyerB, 100);

  const allot::Result a = h.service.purchase_batch(as(kBuyerA, 150, 10), {7, 8}, {2, 3});
  assert(a.ok);
  assert(h.service.last_receipt().native_charged == 10U);
  const allot::Result b = h.service.purchase_batch_aggregated(as(kBuyerB, 150, 50), {8, 7}, {3, 1});
  assert(b.ok);
  assert(h.service.last_receipt().native_refunded == 42U);
  assert(h.native.balance_of(kRecipient) == 18U);

  for (allot::ItemId item : {7, 8}) {
    const allot::SupplySnapshot supply = h.service.remaining_supply(item);
    assert(supply.held == 10U - supply.total_sold);
  }
  assert(h.service.remaining_supply(7).total_sold == 3U);
  assert(h.service.remaining_supply(8).total_sold == 6U);
  check_invariants(h);
}

}  // namespace

int main() {
  test_indexed_set_swap_remove();
  test_single_purchase_and_quota();
  test_native_refund_of_excess();
  test_duplicate_and_shape_rejections();
  test_reconfigure_resets_quota();
  test_aggregated_token_batch_single_pull();
  test_per_item_token_batch_pulls_each_entry();
  test_batch_is_all_or_nothing();
  test_stray_native_currency_rejected();
  test_supply_and_window_boundaries();
  test_admission_inventory_and_overflow();
  test_sale_parameter_validation();
  test_reentrant_calls_rejected();
  test_failed_delivery_reverts_bookkeeping();
  test_failed_delivery_returns_token_payment();
  test_failed_later_pull_returns_earlier_pulls();
  test_reactivation_requires_held_inventory();
  test_pause_owner_and_initialization_guards();
  test_deposit_callback_authorization();
  test_inventory_guard_withdrawals();
  test_native_and_token_withdrawals();
  test_active_sale_pagination();
  test_state_and_journal_survive_restart();
  test_admin_controls_survive_restart();
  test_corrupt_snapshot_rejected();
  test_journal_content_ids_and_reload();
  test_engine_config_file();
  test_held_inventory_tracks_sales();

  std::cout << "allot_unit_tests passed\n";
  return 0;
}
