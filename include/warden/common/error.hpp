#pragma once

#include <warden/schema/enum_string.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warden::common {

enum class error_code_t : uint16_t {
  invalid_input = 1,
  invalid_amount = 2,
  duplicate_account = 3,
  account_not_found = 4,
  insufficient_funds = 5,
  currency_mismatch = 6,
  unauthorized_promotion = 7,
  halted_by_operator = 8,
  chain_integrity_violation = 9,
  latency_cap_exceeded = 10,
  approval_not_found = 11,
  approval_already_resolved = 12,
  crypto_failure = 13,
};

inline constexpr auto kErrorCodeMappings =
    schema::enum_mappings_t<error_code_t, 13>{{
        {"invalid_input", error_code_t::invalid_input},
        {"invalid_amount", error_code_t::invalid_amount},
        {"duplicate_account", error_code_t::duplicate_account},
        {"account_not_found", error_code_t::account_not_found},
        {"insufficient_funds", error_code_t::insufficient_funds},
        {"currency_mismatch", error_code_t::currency_mismatch},
        {"unauthorized_promotion", error_code_t::unauthorized_promotion},
        {"halted_by_operator", error_code_t::halted_by_operator},
        {"chain_integrity_violation",
         error_code_t::chain_integrity_violation},
        {"latency_cap_exceeded", error_code_t::latency_cap_exceeded},
        {"approval_not_found", error_code_t::approval_not_found},
        {"approval_already_resolved",
         error_code_t::approval_already_resolved},
        {"crypto_failure", error_code_t::crypto_failure},
    }};

inline constexpr std::string_view to_string(const error_code_t value) {
  return schema::to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// Business-rule rejections are recorded as transaction data; these codes
/// are the ones the engine converts instead of propagating.
constexpr bool is_business_rejection(const error_code_t code) {
  return code == error_code_t::invalid_amount ||
         code == error_code_t::account_not_found ||
         code == error_code_t::insufficient_funds ||
         code == error_code_t::currency_mismatch;
}

/// Explicit failure surfaced to callers of the core.
class error : public std::runtime_error {
 public:
  error(error_code_t code, const std::string& message);

  error_code_t code() const noexcept { return code_; }

 private:
  error_code_t code_;
};

/// Raised by chain and signature verification; names the first entry whose
/// digest, predecessor link or signature does not hold.
class chain_integrity_violation final : public error {
 public:
  chain_integrity_violation(uint64_t sequence, const std::string& reason);

  uint64_t sequence() const noexcept { return sequence_; }

 private:
  uint64_t sequence_;
};

}  // namespace warden::common
