#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

#include "core/ledger/collaborators.hpp"

namespace allot {

// Invoked after a transfer has been applied; lets a host observe or call back into the engine.
using TransferHook = std::function<void(const Address& from, const Address& to)>;

class InMemoryAssetLedger final : public IAssetLedger {
public:
  explicit InMemoryAssetLedger(Address address);

  [[nodiscard]] Address address() const override { return address_; }
  [[nodiscard]] std::uint64_t balance_of(const Address& holder, ItemId item) const override;

  Result safe_transfer(const Address& from, const Address& to, ItemId item, std::uint64_t amount) override;
  Result safe_batch_transfer(const Address& from, const Address& to, const std::vector<ItemId>& items,
                             const std::vector<std::uint64_t>& amounts) override;

  Result mint(const Address& to, ItemId item, std::uint64_t amount);
  void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }
  void set_fail_transfers(bool fail) { fail_transfers_ = fail; }

  [[nodiscard]] std::size_t transfer_calls() const { return transfer_calls_; }
  [[nodiscard]] std::size_t batch_transfer_calls() const { return batch_transfer_calls_; }

private:
  Result apply_transfer(const Address& from, const Address& to, const std::vector<ItemId>& items,
                        const std::vector<std::uint64_t>& amounts);

  Address address_;
  std::map<std::pair<Address, ItemId>, std::uint64_t> balances_;
  TransferHook hook_;
  bool fail_transfers_ = false;
  std::size_t transfer_calls_ = 0;
  std::size_t batch_transfer_calls_ = 0;
};

class InMemoryTokenLedger final : public ITokenLedger {
public:
  [[nodiscard]] Amount balance_of(const Address& token, const Address& holder) const override;
  [[nodiscard]] Amount allowance(const Address& token, const Address& owner,
                                 const Address& spender) const override;

  Result transfer_from(const Address& token, const Address& spender, const Address& from, const Address& to,
                       Amount amount) override;
  Result transfer(const Address& token, const Address& from, const Address& to, Amount amount) override;

  Result mint(const Address& token, const Address& to, Amount amount);
  void approve(const Address& token, const Address& owner, const Address& spender, Amount amount);
  void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

  [[nodiscard]] std::size_t pull_calls() const { return pull_calls_; }
  [[nodiscard]] const std::vector<std::pair<Address, Amount>>& pulls() const { return pulls_; }

private:
  Result move_balance(const Address& token, const Address& from, const Address& to, Amount amount);

  std::map<std::pair<Address, Address>, Amount> balances_;
  std::map<std::tuple<Address, Address, Address>, Amount> allowances_;
  TransferHook hook_;
  std::size_t pull_calls_ = 0;
  std::vector<std::pair<Address, Amount>> pulls_;
};

class InMemoryNativeLedger final : public INativeLedger {
public:
  [[nodiscard]] Amount balance_of(const Address& holder) const override;
  Result transfer(const Address& from, const Address& to, Amount amount) override;

  Result credit(const Address& to, Amount amount);
  void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

  [[nodiscard]] std::size_t transfer_calls() const { return transfer_calls_; }

private:
  std::map<Address, Amount> balances_;
  TransferHook hook_;
  std::size_t transfer_calls_ = 0;
};

}  // namespace allot
