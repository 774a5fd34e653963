#include "core/settlement/payment_settlement.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

#include "core/util/checked_math.hpp"

namespace allot {

Result SettlementPlan::charge_per_entry(const Address& payment_token, Amount amount) {
  if (is_native_currency(payment_token)) {
    return add_native(amount);
  }
  token_charges_.push_back({payment_token, amount});
  return Result::success();
}

Result SettlementPlan::charge_aggregated(const Address& payment_token, Amount amount) {
  if (is_native_currency(payment_token)) {
    return add_native(amount);
  }

  // Few distinct tokens per bounded batch; a linear scan is enough.
  const auto found = std::ranges::find_if(token_charges_, [&payment_token](const TokenCharge& charge) {
    return charge.token == payment_token;
  });
  if (found == token_charges_.end()) {
    token_charges_.push_back({payment_token, amount});
    return Result::success();
  }

  const auto total = util::checked_add(found->amount, amount);
  if (!total.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Token charge total overflows for " + payment_token.value + ".");
  }
  found->amount = *total;
  return Result::success();
}

Result SettlementPlan::add_native(Amount amount) {
  const auto total = util::checked_add(native_total_, amount);
  if (!total.has_value()) {
    return Result::failure(ErrorCode::ArithmeticOverflow, "Native charge total overflows.");
  }
  native_total_ = *total;
  return Result::success();
}

PaymentSettlement::PaymentSettlement(INativeLedger& native, ITokenLedger& tokens, Address engine_account)
    : native_(native), tokens_(tokens), engine_account_(std::move(engine_account)) {}

Result PaymentSettlement::check_tender(const SettlementPlan& plan, Amount tendered) const {
  if (plan.native_total() == 0 && tendered > 0) {
    return Result::failure(ErrorCode::InvalidPaymentCurrency,
                           "Native currency tendered for a purchase priced in a token.");
  }
  if (tendered < plan.native_total()) {
    return Result::failure(ErrorCode::InsufficientPayment,
                           "Tendered " + std::to_string(tendered) + " but " + std::to_string(plan.native_total()) +
                               " is due.");
  }
  return Result::success();
}

Result PaymentSettlement::preflight(const SettlementPlan& plan, const CallContext& ctx) const {
  if (ctx.value > 0 && native_.balance_of(ctx.caller) < ctx.value) {
    return Result::failure(ErrorCode::InsufficientPayment, "Caller cannot fund the tendered native amount.");
  }

  std::map<Address, Amount> due_by_token;
  for (const TokenCharge& charge : plan.token_charges()) {
    const auto total = util::checked_add(due_by_token[charge.token], charge.amount);
    if (!total.has_value()) {
      return Result::failure(ErrorCode::ArithmeticOverflow, "Token charge total overflows for " + charge.token.value + ".");
    }
    due_by_token[charge.token] = *total;
  }

  for (const auto& [token, due] : due_by_token) {
    if (tokens_.balance_of(token, ctx.caller) < due) {
      return Result::failure(ErrorCode::InsufficientPayment, "Token balance cannot cover " + token.value + " charges.");
    }
    if (tokens_.allowance(token, ctx.caller, engine_account_) < due) {
      return Result::failure(ErrorCode::InsufficientPayment, "Token allowance cannot cover " + token.value + " charges.");
    }
  }
  return Result::success();
}

Result PaymentSettlement::collect(const SettlementPlan& plan, const CallContext& ctx, HeldPayment& held,
                                  SettlementReceipt& receipt) {
  if (ctx.value > 0) {
    const Result escrowed = native_.transfer(ctx.caller, engine_account_, ctx.value);
    if (!escrowed.ok) {
      return Result::failure(ErrorCode::TransferFailed, "Native tender escrow failed: " + escrowed.message);
    }
    held.native = ctx.value;
  }

  for (const TokenCharge& charge : plan.token_charges()) {
    const Result pulled =
        tokens_.transfer_from(charge.token, engine_account_, ctx.caller, engine_account_, charge.amount);
    if (!pulled.ok) {
      return Result::failure(ErrorCode::TransferFailed, "Token pull failed: " + pulled.message);
    }
    held.tokens.push_back(charge);
    ++receipt.token_pulls;
  }
  return Result::success();
}

Result PaymentSettlement::release(const SettlementPlan& plan, const CallContext& ctx, const Address& recipient,
                                  HeldPayment& held, SettlementReceipt& receipt) {
  const Amount excess = held.native - std::min(held.native, plan.native_total());
  if (excess > 0) {
    const Result refunded = native_.transfer(engine_account_, ctx.caller, excess);
    if (!refunded.ok) {
      return Result::failure(ErrorCode::TransferFailed, "Native refund failed: " + refunded.message);
    }
    held.native -= excess;
    receipt.native_refunded = excess;
  }

  if (held.native > 0) {
    const Result forwarded = native_.transfer(engine_account_, recipient, held.native);
    if (!forwarded.ok) {
      return Result::failure(ErrorCode::TransferFailed, "Native forward failed: " + forwarded.message);
    }
    receipt.native_charged = held.native;
    held.native = 0;
  }

  while (!held.tokens.empty()) {
    const TokenCharge& charge = held.tokens.back();
    const Result forwarded = tokens_.transfer(charge.token, engine_account_, recipient, charge.amount);
    if (!forwarded.ok) {
      return Result::failure(ErrorCode::TransferFailed, "Token forward failed: " + forwarded.message);
    }
    held.tokens.pop_back();
  }
  return Result::success();
}

Result PaymentSettlement::return_held(const CallContext& ctx, HeldPayment& held) {
  Result outcome = Result::success();
  if (held.native > 0) {
    const Result returned = native_.transfer(engine_account_, ctx.caller, held.native);
    if (returned.ok) {
      held.native = 0;
    } else {
      outcome = Result::failure(ErrorCode::TransferFailed, "Native return failed: " + returned.message);
    }
  }

  std::vector<TokenCharge> stuck;
  for (const TokenCharge& charge : held.tokens) {
    const Result returned = tokens_.transfer(charge.token, engine_account_, ctx.caller, charge.amount);
    if (!returned.ok) {
      if (outcome.ok) {
        outcome = Result::failure(ErrorCode::TransferFailed, "Token return failed: " + returned.message);
      }
      stuck.push_back(charge);
    }
  }
  held.tokens = std::move(stuck);
  return outcome;
}

}  // namespace allot
