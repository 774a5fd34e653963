#pragma once

#include <unordered_map>
#include <vector>

#include "core/ledger/collaborators.hpp"
#include "core/model/types.hpp"
#include "core/util/indexed_set.hpp"

namespace allot {

using ActiveSaleIndex = util::IndexedSet<ItemId>;

// Owns every SaleConfig and the index of active items. The index is only ever
// changed together with SaleConfig::active, so both always describe the same set.
class SaleRegistry {
public:
  // Starts a new sale version for `draft.item`. `assets` is consulted only when the
  // draft asks for inventory verification; `holder` is the account that holds stock.
  Result configure(const SaleDraft& draft, const IAssetLedger* assets, const Address& holder);
  Result update_params(ItemId item, Amount new_price, Timestamp new_end_time);
  Result set_active(ItemId item, bool active, Timestamp now, const IAssetLedger* assets, const Address& holder);

  Result add_sold(ItemId item, Quantity quantity);
  void restore_sold(ItemId item, Quantity total_sold);

  [[nodiscard]] const SaleConfig* find(ItemId item) const;
  [[nodiscard]] bool is_active(ItemId item) const;
  [[nodiscard]] const std::vector<ItemId>& active_items() const { return active_index_.items(); }
  [[nodiscard]] const std::unordered_map<ItemId, SaleConfig>& configs() const { return configs_; }
  [[nodiscard]] bool index_consistent() const;

  // Replaces the whole table, e.g. from a snapshot. Rejects data that breaks an
  // invariant and leaves the current state unchanged in that case.
  Result restore(std::unordered_map<ItemId, SaleConfig> configs, const std::vector<ItemId>& index_order);

private:
  std::unordered_map<ItemId, SaleConfig> configs_;
  ActiveSaleIndex active_index_;
};

}  // namespace allot
