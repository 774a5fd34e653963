#pragma once

#include <cstdint>

#include "core/ledger/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/sale/sale_registry.hpp"

namespace allot {

// Keeps administrator withdrawals from eating into stock an active sale still owes.
class InventoryGuard {
public:
  InventoryGuard(const SaleRegistry& registry, const IAssetLedger& assets, Address holder);

  [[nodiscard]] Result check_withdrawable(ItemId item, std::uint64_t requested) const;
  [[nodiscard]] std::uint64_t withdrawable(ItemId item) const;

private:
  [[nodiscard]] std::uint64_t reserved(ItemId item) const;

  const SaleRegistry& registry_;
  const IAssetLedger& assets_;
  Address holder_;
};

}  // namespace allot
