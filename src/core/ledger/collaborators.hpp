#pragma once

#include <cstdint>
#include <vector>

#include "core/model/types.hpp"

namespace allot {

// Ledger of item balances. Transfers are all-or-nothing per call.
class IAssetLedger {
public:
  virtual ~IAssetLedger() = default;

  [[nodiscard]] virtual Address address() const = 0;
  [[nodiscard]] virtual std::uint64_t balance_of(const Address& holder, ItemId item) const = 0;

  virtual Result safe_transfer(const Address& from, const Address& to, ItemId item, std::uint64_t amount) = 0;
  virtual Result safe_batch_transfer(const Address& from, const Address& to, const std::vector<ItemId>& items,
                                     const std::vector<std::uint64_t>& amounts) = 0;
};

// Multi-token fungible ledger addressed by token identifier.
class ITokenLedger {
public:
  virtual ~ITokenLedger() = default;

  [[nodiscard]] virtual Amount balance_of(const Address& token, const Address& holder) const = 0;
  [[nodiscard]] virtual Amount allowance(const Address& token, const Address& owner,
                                         const Address& spender) const = 0;

  // Pulls `amount` from `from` to `to`, spending `spender`'s allowance.
  virtual Result transfer_from(const Address& token, const Address& spender, const Address& from,
                               const Address& to, Amount amount) = 0;
  virtual Result transfer(const Address& token, const Address& from, const Address& to, Amount amount) = 0;
};

class INativeLedger {
public:
  virtual ~INativeLedger() = default;

  [[nodiscard]] virtual Amount balance_of(const Address& holder) const = 0;
  virtual Result transfer(const Address& from, const Address& to, Amount amount) = 0;
};

}  // namespace allot
