#include "core/sale/inventory_guard.hpp"

#include <string>
#include <utility>

#include "core/util/checked_math.hpp"

namespace allot {

InventoryGuard::InventoryGuard(const SaleRegistry& registry, const IAssetLedger& assets, Address holder)
    : registry_(registry), assets_(assets), holder_(std::move(holder)) {}

Result InventoryGuard::check_withdrawable(ItemId item, std::uint64_t requested) const {
  const std::uint64_t needed = reserved(item);
  if (needed == 0) {
    return Result::success();
  }

  const auto required = util::checked_add(requested, needed);
  if (!required.has_value() || assets_.balance_of(holder_, item) < *required) {
    return Result::failure(ErrorCode::ActiveSaleInventoryRequired,
                           "Withdrawal would leave the active sale of item " + std::to_string(item) +
                               " short of " + std::to_string(needed) + " units.");
  }
  return Result::success();
}

std::uint64_t InventoryGuard::withdrawable(ItemId item) const {
  const std::uint64_t held = assets_.balance_of(holder_, item);
  const std::uint64_t needed = reserved(item);
  return held > needed ? held - needed : 0;
}

std::uint64_t InventoryGuard::reserved(ItemId item) const {
  if (!registry_.is_active(item)) {
    return 0;
  }
  return registry_.find(item)->remaining();
}

}  // namespace allot
