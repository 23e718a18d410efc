#pragma once

#include <warden/schema/audit_event.hpp>
#include <warden/schema/execution_mode.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_status.hpp>

#include <optional>
#include <string>

namespace warden::schema {

/// What a caller asked for, before any decision is taken.
struct transaction_intent_t final {
  std::string from;
  std::string to;
  amount_t amount;
  std::string currency;
};

/// Balances both accounts would hold after the transfer.
struct balance_projection_t final {
  amount_t from_balance;
  amount_t to_balance;
};

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  std::string transaction_id;
  std::string from;
  std::string to;
  amount_t amount;
  std::string currency;
  execution_mode_t mode{execution_mode_t::shadow};
  transaction_status_t status{transaction_status_t::pending};
  /// Error code name of a business rejection, or the approval outcome.
  std::optional<std::string> rejection_reason;
  hash32_t digest{};
  bool witnessed{false};
  std::optional<uint64_t> audit_sequence;
  std::optional<std::string> approval_request_id;
  std::optional<balance_projection_t> projection;
  timestamp_milliseconds_t created_at{};
};

using transaction_t = transaction<1>;

/// Fresh `TX-` identifier with 128 bits of CSPRNG entropy.
std::string make_transaction_id();

/// Digest of the identifying fields. The amount enters in its canonical
/// text form.
hash32_t make_transaction_digest(const transaction_t& tx);

transaction_t make_transaction(const transaction_intent_t& intent,
                               execution_mode_t mode,
                               timestamp_milliseconds_t now);

/// Audit payload describing the transaction in `status`.
payload_t make_transaction_payload(const transaction_t& tx);

/// Moves `tx` to `to`; an illegal transition is a programming error and
/// terminates.
void transition(transaction_t& tx, transaction_status_t to);

}  // namespace warden::schema
