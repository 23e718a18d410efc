#pragma once

#include <warden/crypto/signature_authority.hpp>
#include <warden/execution/gate.hpp>
#include <warden/schema/approval_token.hpp>
#include <warden/schema/audit_event.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// ML-DSA-65 where the linked OpenSSL provides it, Ed25519 otherwise.
inline warden::schema::signature_scheme_t test_scheme() {
  return warden::crypto::available(
             warden::schema::signature_scheme_t::ml_dsa_65)
             ? warden::schema::signature_scheme_t::ml_dsa_65
             : warden::schema::signature_scheme_t::ed25519;
}

inline warden::schema::amount_t amount(const std::string_view text) {
  return warden::schema::make_amount(text);
}

inline warden::schema::approval_token_t make_token(
    const warden::crypto::signature_authority& approver,
    const warden::schema::execution_mode_t from,
    const warden::schema::execution_mode_t to,
    const warden::schema::timestamp_milliseconds_t issued_at = 1000) {
  auto token = warden::schema::approval_token_t{};
  token.from = from;
  token.to = to;
  token.approver_id = approver.signer_id();
  token.issued_at = issued_at;
  token.signature = approver.sign(warden::execution::make_promotion_digest(
      from, to, token.approver_id, issued_at));
  return token;
}

inline std::size_t count_kind(
    const std::vector<warden::schema::audit_event_t>& events,
    const warden::schema::audit_event_kind_t kind) {
  return static_cast<std::size_t>(std::count_if(
      std::begin(events), std::end(events),
      [&](const warden::schema::audit_event_t& event) {
        return event.kind == kind;
      }));
}

/// Events carrying `transaction_id` and the given `status` payload fields.
inline std::size_t count_outcomes(
    const std::vector<warden::schema::audit_event_t>& events,
    const std::string& transaction_id,
    const std::string_view status) {
  return static_cast<std::size_t>(std::count_if(
      std::begin(events), std::end(events),
      [&](const warden::schema::audit_event_t& event) {
        return warden::schema::find_field(event.payload, "transaction_id") ==
                   std::string_view{transaction_id} &&
               warden::schema::find_field(event.payload, "status") == status;
      }));
}

}  // namespace warden::testing
