#include "core/sale/purchase_validator.hpp"

#include <string>
#include <utility>

#include "core/util/checked_math.hpp"

namespace allot {

PurchaseValidator::PurchaseValidator(const SaleRegistry& registry, const PurchaseLedger& ledger,
                                     const IAssetLedger& assets, Address holder)
    : registry_(registry), ledger_(ledger), assets_(assets), holder_(std::move(holder)) {}

Result PurchaseValidator::admit(ItemId item, Quantity quantity, const Address& buyer, Timestamp now) const {
  const std::string label = "item " + std::to_string(item);

  const SaleConfig* config = registry_.find(item);
  if (config == nullptr || !registry_.is_active(item)) {
    return Result::failure(ErrorCode::SaleNotActive, "Sale for " + label + " is not active.");
  }

  if (!config->in_window(now)) {
    return Result::failure(ErrorCode::SaleNotActive, "Sale for " + label + " is outside its time window.");
  }

  const auto sold_after = util::checked_add(config->total_sold, quantity);
  if (!sold_after.has_value() || *sold_after > config->max_supply) {
    return Result::failure(ErrorCode::ExceedsMaxSupply, "Purchase exceeds remaining supply of " + label + ".");
  }

  if (assets_.balance_of(holder_, item) < quantity) {
    return Result::failure(ErrorCode::InsufficientInventory, "Held inventory cannot cover " + label + ".");
  }

  if (config->max_per_address > 0) {
    const auto bought_after =
        util::checked_add(ledger_.purchased(item, config->sale_version, buyer), quantity);
    if (!bought_after.has_value() || *bought_after > config->max_per_address) {
      return Result::failure(ErrorCode::ExceedsMaxPerAddress,
                             "Purchase exceeds the per-buyer allocation of " + label + ".");
    }
  }

  return Result::success();
}

}  // namespace allot
