#pragma once

#include "core/ledger/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/sale/purchase_ledger.hpp"
#include "core/sale/sale_registry.hpp"

namespace allot {

// Read-only admission control. Checks run in a fixed order and the first failing
// one decides the reported code:
//   active -> time window -> max supply -> held inventory -> per-buyer quota.
class PurchaseValidator {
public:
  PurchaseValidator(const SaleRegistry& registry, const PurchaseLedger& ledger, const IAssetLedger& assets,
                    Address holder);

  [[nodiscard]] Result admit(ItemId item, Quantity quantity, const Address& buyer, Timestamp now) const;

private:
  const SaleRegistry& registry_;
  const PurchaseLedger& ledger_;
  const IAssetLedger& assets_;
  Address holder_;
};

}  // namespace allot
