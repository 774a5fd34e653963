#include "core/ledger/in_memory_ledgers.hpp"

#include <string>

#include "core/util/checked_math.hpp"

namespace allot {

InMemoryAssetLedger::InMemoryAssetLedger(Address address) : address_(std::move(address)) {}

std::uint64_t InMemoryAssetLedger::balance_of(const Address& holder, ItemId item) const {
  const auto found = balances_.find({holder, item});
  return found == balances_.end() ? 0 : found->second;
}

Result InMemoryAssetLedger::safe_transfer(const Address& from, const Address& to, ItemId item,
                                          std::uint64_t amount) {
  ++transfer_calls_;
  return apply_transfer(from, to, {item}, {amount});
}

Result InMemoryAssetLedger::safe_batch_transfer(const Address& from, const Address& to,
                                                const std::vector<ItemId>& items,
                                                const std::vector<std::uint64_t>& amounts) {
  ++batch_transfer_calls_;
  return apply_transfer(from, to, items, amounts);
}

Result InMemoryAssetLedger::apply_transfer(const Address& from, const Address& to,
                                           const std::vector<ItemId>& items,
                                           const std::vector<std::uint64_t>& amounts) {
  if (fail_transfers_) {
    return Result::failure(ErrorCode::TransferFailed, "Asset ledger rejected the transfer.");
  }
  if (to.empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "Asset transfer to the empty address.");
  }
  if (items.size() != amounts.size()) {
    return Result::failure(ErrorCode::ArrayLengthMismatch, "Asset batch items and amounts differ in length.");
  }

  std::map<ItemId, std::uint64_t> debits;
  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto total = util::checked_add(debits[items[i]], amounts[i]);
    if (!total.has_value()) {
      return Result::failure(ErrorCode::ArithmeticOverflow, "Asset batch amount overflow.");
    }
    debits[items[i]] = *total;
  }
  for (const auto& [item, amount] : debits) {
    if (balance_of(from, item) < amount) {
      return Result::failure(ErrorCode::InsufficientInventory,
                             "Asset balance too low for item " + std::to_string(item) + ".");
    }
    if (from != to && !util::checked_add(balance_of(to, item), amount).has_value()) {
      return Result::failure(ErrorCode::ArithmeticOverflow, "Asset receiver balance overflow.");
    }
  }

  for (const auto& [item, amount] : debits) {
    balances_[{from, item}] -= amount;
    balances_[{to, item}] += amount;
  }

  if (hook_) {
    hook_(from, to);
  }
  return Result::success();
}

Result InMemoryAssetLedger::mint(const Address& to, ItemId item, std::uint64_t amount) {
  const auto total = util::checked_add(balance_of(to, item), amount);
  if (!total.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Asset mint overflow.");
  }
  balances_[{to, item}] = *total;
  return Result::success();
}

Amount InMemoryTokenLedger::balance_of(const Address& token, const Address& holder) const {
  const auto found = balances_.find({token, holder});
  return found == balances_.end() ? 0 : found->second;
}

Amount InMemoryTokenLedger::allowance(const Address& token, const Address& owner, const Address& spender) const {
  const auto found = allowances_.find({token, owner, spender});
  return found == allowances_.end() ? 0 : found->second;
}

Result InMemoryTokenLedger::transfer_from(const Address& token, const Address& spender, const Address& from,
                                          const Address& to, Amount amount) {
  ++pull_calls_;
  const Amount allowed = allowance(token, from, spender);
  if (allowed < amount) {
    return Result::failure(ErrorCode::TransferFailed, "Token allowance too low for " + token.value + ".");
  }

  const Result moved = move_balance(token, from, to, amount);
  if (!moved.ok) {
    return moved;
  }
  allowances_[{token, from, spender}] = allowed - amount;
  pulls_.emplace_back(token, amount);

  if (hook_) {
    hook_(from, to);
  }
  return Result::success();
}

Result InMemoryTokenLedger::transfer(const Address& token, const Address& from, const Address& to, Amount amount) {
  const Result moved = move_balance(token, from, to, amount);
  if (moved.ok && hook_) {
    hook_(from, to);
  }
  return moved;
}

Result InMemoryTokenLedger::mint(const Address& token, const Address& to, Amount amount) {
  const auto total = util::checked_add(balance_of(token, to), amount);
  if (!total.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Token mint overflow.");
  }
  balances_[{token, to}] = *total;
  return Result::success();
}

void InMemoryTokenLedger::approve(const Address& token, const Address& owner, const Address& spender,
                                  Amount amount) {
  allowances_[{token, owner, spender}] = amount;
}

Result InMemoryTokenLedger::move_balance(const Address& token, const Address& from, const Address& to,
                                         Amount amount) {
  if (token.empty() || to.empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "Token transfer needs a token and a receiver.");
  }
  if (balance_of(token, from) < amount) {
    return Result::failure(ErrorCode::TransferFailed, "Token balance too low for " + token.value + ".");
  }
  if (from != to && !util::checked_add(balance_of(token, to), amount).has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Token receiver balance overflow.");
  }
  balances_[{token, from}] -= amount;
  balances_[{token, to}] += amount;
  return Result::success();
}

Amount InMemoryNativeLedger::balance_of(const Address& holder) const {
  const auto found = balances_.find(holder);
  return found == balances_.end() ? 0 : found->second;
}

Result InMemoryNativeLedger::transfer(const Address& from, const Address& to, Amount amount) {
  ++transfer_calls_;
  if (to.empty()) {
    return Result::failure(ErrorCode::InvalidAddress, "Native transfer to the empty address.");
  }
  if (balance_of(from) < amount) {
    return Result::failure(ErrorCode::TransferFailed, "Native balance too low for " + from.value + ".");
  }
  if (from != to && !util::checked_add(balance_of(to), amount).has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Native receiver balance overflow.");
  }
  balances_[from] -= amount;
  balances_[to] += amount;

  if (hook_) {
    hook_(from, to);
  }
  return Result::success();
}

Result InMemoryNativeLedger::credit(const Address& to, Amount amount) {
  const auto total = util::checked_add(balance_of(to), amount);
  if (!total.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Native credit overflow.");
  }
  balances_[to] = *total;
  return Result::success();
}

}  // namespace allot
