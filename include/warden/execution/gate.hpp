#pragma once

#include <warden/schema/approval_token.hpp>
#include <warden/schema/decision.hpp>
#include <warden/schema/execution_mode.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/public_key.hpp>
#include <warden/schema/transaction.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace warden::execution {

struct trusted_approver_t final {
  std::string approver_id;
  schema::public_key_t public_key;
};

struct gate_options final {
  /// Amounts up to and including the limit auto-commit in that mode.
  schema::amount_t pilot_auto_commit_limit{0};
  schema::amount_t production_auto_commit_limit{1000000};
  std::vector<trusted_approver_t> trusted_approvers;
};

/// Decision plus the shared hold on the mode it was taken in. The hold is
/// released when the authorization is destroyed.
struct authorization_t final {
  schema::decision_t decision;
  schema::execution_mode_t mode{schema::execution_mode_t::shadow};
  std::shared_lock<std::shared_mutex> hold;
};

/// Runs under the exclusive lock before the new mode is published.
using transition_witness_t =
    std::function<void(schema::execution_mode_t from,
                       schema::execution_mode_t to,
                       const schema::approval_token_t& token)>;

/// Digest an approver signs to authorize one promotion.
schema::hash32_t make_promotion_digest(schema::execution_mode_t from,
                                       schema::execution_mode_t to,
                                       const std::string& approver_id,
                                       schema::timestamp_milliseconds_t issued_at);

/// Execution mode state machine. Starts in SHADOW and only moves up one
/// tier at a time on a verified approval token. Never touches the ledger.
class gate final {
 public:
  explicit gate(gate_options options = {});

  gate(const gate&) = delete;
  gate& operator=(const gate&) = delete;

  schema::execution_mode_t mode() const;

  authorization_t authorize(const schema::transaction_intent_t& intent) const;

  /// Throws `error` with `unauthorized_promotion` when the token is missing,
  /// names another transition, comes from an untrusted approver or does not
  /// verify, or when `target` is not the next tier.
  void promote(schema::execution_mode_t target,
               const std::optional<schema::approval_token_t>& token,
               const transition_witness_t& witness = {});

  const gate_options& options() const { return options_; }

 private:
  schema::decision_t decide(schema::execution_mode_t mode,
                            const schema::amount_t& amount) const;

  gate_options options_;
  mutable std::shared_mutex mutex_;
  schema::execution_mode_t mode_{schema::execution_mode_t::shadow};
};

}  // namespace warden::execution
