#include "core/sale/sale_registry.hpp"

#include <string>
#include <utility>

#include "core/util/checked_math.hpp"

namespace allot {
namespace {

std::string item_label(ItemId item) {
  return "item " + std::to_string(item);
}

}  // namespace

Result SaleRegistry::configure(const SaleDraft& draft, const IAssetLedger* assets, const Address& holder) {
  if (draft.price == 0) {
    return Result::failure(ErrorCode::ZeroAmount, "Sale price must be positive.");
  }
  if (draft.max_supply == 0) {
    return Result::failure(ErrorCode::ZeroAmount, "Sale max supply must be positive.");
  }
  if (draft.start_time >= draft.end_time) {
    return Result::failure(ErrorCode::InvalidTimeRange, "Sale start time must precede its end time.");
  }

  SaleVersion previous_version = 0;
  if (const auto found = configs_.find(draft.item); found != configs_.end()) {
    if (found->second.active) {
      return Result::failure(ErrorCode::SaleMustBeInactive,
                             "Deactivate " + item_label(draft.item) + " before reconfiguring it.");
    }
    previous_version = found->second.sale_version;
  }

  if (draft.verify_inventory) {
    if (assets == nullptr) {
      return Result::failure(ErrorCode::NotInitialized, "Inventory verification needs an asset ledger.");
    }
    if (assets->balance_of(holder, draft.item) < draft.max_supply) {
      return Result::failure(ErrorCode::InsufficientInventory,
                             "Held inventory does not cover max supply of " + item_label(draft.item) + ".");
    }
  }

  const auto next_version = util::checked_add<SaleVersion>(previous_version, 1);
  if (!next_version.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Sale version counter exhausted.");
  }

  configs_[draft.item] = SaleConfig{
      .price = draft.price,
      .start_time = draft.start_time,
      .end_time = draft.end_time,
      .max_supply = draft.max_supply,
      .max_per_address = draft.max_per_address,
      .total_sold = 0,
      .payment_token = draft.payment_token,
      .active = true,
      .sale_version = *next_version,
  };
  active_index_.insert(draft.item);
  return Result::success("Sale configured.", std::to_string(*next_version));
}

Result SaleRegistry::update_params(ItemId item, Amount new_price, Timestamp new_end_time) {
  const auto found = configs_.find(item);
  if (found == configs_.end() || !found->second.exists()) {
    return Result::failure(ErrorCode::SaleNotFound, "No sale configured for " + item_label(item) + ".");
  }
  if (new_price == 0) {
    return Result::failure(ErrorCode::ZeroAmount, "Sale price must be positive.");
  }
  if (new_end_time < found->second.end_time) {
    return Result::failure(ErrorCode::InvalidTimeRange, "Sale end time may only be extended.");
  }

  found->second.price = new_price;
  found->second.end_time = new_end_time;
  return Result::success("Sale parameters updated.");
}

Result SaleRegistry::set_active(ItemId item, bool active, Timestamp now, const IAssetLedger* assets,
                                const Address& holder) {
  const auto found = configs_.find(item);
  if (found == configs_.end() || !found->second.exists()) {
    return Result::failure(ErrorCode::SaleNotFound, "No sale configured for " + item_label(item) + ".");
  }

  SaleConfig& config = found->second;
  if (!active) {
    config.active = false;
    active_index_.erase(item);
    return Result::success("Sale deactivated.");
  }

  if (config.start_time >= config.end_time || now > config.end_time) {
    return Result::failure(ErrorCode::InvalidTimeRange, "Sale window of " + item_label(item) + " is closed.");
  }
  if (assets == nullptr) {
    return Result::failure(ErrorCode::NotInitialized, "Activation needs an asset ledger.");
  }
  if (assets->balance_of(holder, item) < config.remaining()) {
    return Result::failure(ErrorCode::InsufficientInventory,
                           "Held inventory does not cover the remaining allotment of " + item_label(item) + ".");
  }

  config.active = true;
  active_index_.insert(item);
  return Result::success("Sale activated.");
}

Result SaleRegistry::add_sold(ItemId item, Quantity quantity) {
  const auto found = configs_.find(item);
  if (found == configs_.end()) {
    return Result::failure(ErrorCode::SaleNotFound, "No sale configured for " + item_label(item) + ".");
  }
  const auto total = util::checked_add(found->second.total_sold, quantity);
  if (!total.has_value() || *total > found->second.max_supply) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Sold counter of " + item_label(item) + " would overflow.");
  }
  found->second.total_sold = *total;
  return Result::success();
}

void SaleRegistry::restore_sold(ItemId item, Quantity total_sold) {
  if (const auto found = configs_.find(item); found != configs_.end()) {
    found->second.total_sold = total_sold;
  }
}

const SaleConfig* SaleRegistry::find(ItemId item) const {
  const auto found = configs_.find(item);
  return found == configs_.end() ? nullptr : &found->second;
}

bool SaleRegistry::is_active(ItemId item) const {
  const SaleConfig* config = find(item);
  return config != nullptr && config->active && active_index_.contains(item);
}

bool SaleRegistry::index_consistent() const {
  std::size_t active_count = 0;
  for (const auto& [item, config] : configs_) {
    if (config.active) {
      ++active_count;
      if (!active_index_.contains(item)) {
        return false;
      }
    }
  }
  return active_count == active_index_.size();
}

Result SaleRegistry::restore(std::unordered_map<ItemId, SaleConfig> configs, const std::vector<ItemId>& index_order) {
  ActiveSaleIndex index;
  for (ItemId item : index_order) {
    if (!index.insert(item)) {
      return Result::failure(ErrorCode::StorageFailure, "Active index lists " + item_label(item) + " twice.");
    }
    const auto found = configs.find(item);
    if (found == configs.end() || !found->second.active) {
      return Result::failure(ErrorCode::StorageFailure, "Active index lists inactive " + item_label(item) + ".");
    }
  }

  for (const auto& [item, config] : configs) {
    if (config.total_sold > config.max_supply) {
      return Result::failure(ErrorCode::StorageFailure, "Sold counter exceeds max supply for " + item_label(item) + ".");
    }
    if (config.active && (!config.exists() || config.start_time >= config.end_time)) {
      return Result::failure(ErrorCode::StorageFailure, "Active sale has an invalid config for " + item_label(item) + ".");
    }
    if (config.active && !index.contains(item)) {
      return Result::failure(ErrorCode::StorageFailure, "Active " + item_label(item) + " missing from the index.");
    }
  }

  configs_ = std::move(configs);
  active_index_ = std::move(index);
  return Result::success("Sale table restored.");
}

}  // namespace allot
