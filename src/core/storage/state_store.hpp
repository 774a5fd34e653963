#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"
#include "core/sale/purchase_ledger.hpp"
#include "core/sale/sale_registry.hpp"

namespace allot {

// Administrative settings that change at runtime and must outlive a restart.
struct EngineControls {
  Address owner;
  Address payment_recipient;
  bool paused = false;
};

// Text snapshot of the engine controls, the sale table, the active index order and
// the quota ledger.
//
//   engine <owner> <payment_recipient> <paused>
//   sale  <item> <price> <start> <end> <max_supply> <max_per_address> <total_sold> <token> <active> <version>
//   index <item>
//   quota <item> <version> <buyer> <count>
//
// Fields are tab separated; addresses are hex encoded so any byte is safe.
class StateStore {
public:
  explicit StateStore(std::string path);

  [[nodiscard]] bool exists() const;
  [[nodiscard]] const std::string& path() const { return path_; }

  Result save(const EngineControls& controls, const SaleRegistry& registry, const PurchaseLedger& ledger) const;

  // Restores everything or nothing: the snapshot is fully parsed and validated
  // before any target is touched. `controls` stays empty for a snapshot without
  // an engine record.
  Result load(std::optional<EngineControls>& controls, SaleRegistry& registry, PurchaseLedger& ledger) const;

private:
  std::string path_;
};

}  // namespace allot
