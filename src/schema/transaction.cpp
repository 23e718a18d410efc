#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/common/random.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/transaction.hpp>

#include <tuple>

namespace warden::schema {

std::string make_transaction_id() {
  return "TX-" + common::random_hex(16);
}

hash32_t make_transaction_digest(const transaction_t& tx) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{tx.version, tx.transaction_id, tx.from, tx.to,
                 format_amount(tx.amount), tx.currency, tx.mode,
                 tx.created_at});
  return blake3::hash(make_bytes_view(encoded));
}

transaction_t make_transaction(const transaction_intent_t& intent,
                               const execution_mode_t mode,
                               const timestamp_milliseconds_t now) {
  auto tx = transaction_t{};
  tx.transaction_id = make_transaction_id();
  tx.from = intent.from;
  tx.to = intent.to;
  tx.amount = intent.amount;
  tx.currency = intent.currency;
  tx.mode = mode;
  tx.created_at = now;
  tx.digest = make_transaction_digest(tx);
  return tx;
}

payload_t make_transaction_payload(const transaction_t& tx) {
  auto payload = payload_t{
      {"transaction_id", tx.transaction_id},
      {"from", tx.from},
      {"to", tx.to},
      {"amount", format_amount(tx.amount)},
      {"currency", tx.currency},
      {"mode", std::string{to_string(tx.mode)}},
      {"status", std::string{to_string(tx.status)}},
      {"digest", to_hex(tx.digest)},
  };
  if (tx.rejection_reason) {
    payload.push_back({"reason", *tx.rejection_reason});
  }
  if (tx.approval_request_id) {
    payload.push_back({"approval_request_id", *tx.approval_request_id});
  }
  if (tx.projection) {
    payload.push_back(
        {"projected_from_balance", format_amount(tx.projection->from_balance)});
    payload.push_back(
        {"projected_to_balance", format_amount(tx.projection->to_balance)});
  }
  return payload;
}

void transition(transaction_t& tx, const transaction_status_t to) {
  if (!can_transition(tx.status, to)) {
    common::critical("illegal transaction status transition {} -> {} for {}",
                     to_string(tx.status), to_string(to), tx.transaction_id);
  }
  tx.status = to;
}

}  // namespace warden::schema
