#pragma once

#include <cstddef>
#include <vector>

#include "core/ledger/collaborators.hpp"
#include "core/model/types.hpp"

namespace allot {

struct TokenCharge {
  Address token;
  Amount amount = 0;
};

// The payments a request owes, built while entries are admitted. Native charges
// always collapse into one total; token charges either stay one per entry or are
// merged per distinct token.
class SettlementPlan {
public:
  Result charge_per_entry(const Address& payment_token, Amount amount);
  Result charge_aggregated(const Address& payment_token, Amount amount);

  [[nodiscard]] Amount native_total() const { return native_total_; }
  [[nodiscard]] const std::vector<TokenCharge>& token_charges() const { return token_charges_; }

private:
  Result add_native(Amount amount);

  Amount native_total_ = 0;
  std::vector<TokenCharge> token_charges_;
};

// Payment parked on the engine account between collection and release.
struct HeldPayment {
  std::vector<TokenCharge> tokens;
  Amount native = 0;

  [[nodiscard]] bool empty() const { return tokens.empty() && native == 0; }
};

struct SettlementReceipt {
  Amount native_charged = 0;
  Amount native_refunded = 0;
  std::size_t token_pulls = 0;
};

class PaymentSettlement {
public:
  PaymentSettlement(INativeLedger& native, ITokenLedger& tokens, Address engine_account);

  // Native currency tendered must cover the native total, and may only be tendered
  // when something is actually priced in native currency.
  [[nodiscard]] Result check_tender(const SettlementPlan& plan, Amount tendered) const;

  // Confirms every transfer `settle` will issue is covered by balances and allowances.
  [[nodiscard]] Result preflight(const SettlementPlan& plan, const CallContext& ctx) const;

  // Moves the native tender and every token charge from the caller onto the engine
  // account. On failure `held` lists what was already taken.
  Result collect(const SettlementPlan& plan, const CallContext& ctx, HeldPayment& held,
                 SettlementReceipt& receipt);

  // Refunds excess tender to the caller and forwards the charges to the recipient.
  // Whatever could not be moved stays in `held`.
  Result release(const SettlementPlan& plan, const CallContext& ctx, const Address& recipient, HeldPayment& held,
                 SettlementReceipt& receipt);

  // Hands everything in `held` back to the caller. Every entry is attempted; failed
  // ones stay in `held` and the first failure is reported.
  Result return_held(const CallContext& ctx, HeldPayment& held);

private:
  INativeLedger& native_;
  ITokenLedger& tokens_;
  Address engine_account_;
};

}  // namespace allot
