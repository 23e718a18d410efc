#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction status.
// Lifecycle of one transfer attempt. `executed` is real settlement and is
// unreachable while the gate is in SHADOW.
namespace warden::schema {

enum class transaction_status_t : uint8_t {
  pending = 0,
  simulated = 1,
  rejected = 2,
  approval_required = 3,
  executed = 4,
};

inline constexpr auto kTransactionStatusMappings =
    enum_mappings_t<transaction_status_t, 5>{{
        {"PENDING", transaction_status_t::pending},
        {"SIMULATED", transaction_status_t::simulated},
        {"REJECTED", transaction_status_t::rejected},
        {"APPROVAL_REQUIRED", transaction_status_t::approval_required},
        {"EXECUTED", transaction_status_t::executed},
    }};

template <>
inline std::optional<transaction_status_t>
try_from_string<transaction_status_t>(const std::string_view value) {
  return from_string(value, kTransactionStatusMappings);
}

inline constexpr std::string_view to_string(const transaction_status_t value) {
  return to_string(value, kTransactionStatusMappings).value_or("unknown");
}

constexpr bool is_terminal(const transaction_status_t status) {
  switch (status) {
    case transaction_status_t::simulated:
    case transaction_status_t::rejected:
    case transaction_status_t::executed:
      return true;
    case transaction_status_t::pending:
    case transaction_status_t::approval_required:
      return false;
  }
  return false;
}

/// Status only moves forward; terminal states have no successors.
constexpr bool can_transition(const transaction_status_t from,
                              const transaction_status_t to) {
  switch (from) {
    case transaction_status_t::pending:
      return to != transaction_status_t::pending;
    case transaction_status_t::approval_required:
      return to == transaction_status_t::executed ||
             to == transaction_status_t::rejected;
    case transaction_status_t::simulated:
    case transaction_status_t::rejected:
    case transaction_status_t::executed:
      return false;
  }
  return false;
}

}  // namespace warden::schema
