#pragma once

#include <warden/schema/primitives.hpp>

#include <string>
#include <variant>

namespace warden::schema {

/// Compute the outcome against a projection; real balances stay untouched.
struct simulate_t final {};

/// Amount is above the auto-commit limit of the current mode.
struct require_approval_t final {
  std::string reason;
  amount_t limit;
};

/// Settle through the ledger.
struct commit_t final {};

using decision_t = std::variant<simulate_t, require_approval_t, commit_t>;

}  // namespace warden::schema
