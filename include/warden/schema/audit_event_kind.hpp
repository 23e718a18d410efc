#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event kind.
// Governance taxonomy: every witnessed action is classified into exactly
// one of these kinds.
namespace warden::schema {

enum class audit_event_kind_t : uint16_t {
  engine_initialized = 1,
  sandbox_action = 2,
  account_created = 3,
  transaction_simulation = 4,
  transaction_committed = 5,
  transaction_rejected = 6,
  invalid_input = 7,
  approval_requested = 8,
  approval_granted = 9,
  approval_denied = 10,
  approval_expired = 11,
  mode_transition = 12,
  compliance_violation = 13,
  emergency_stop_triggered = 14,
  emergency_stop_cleared = 15,
  evidence_record_generated = 16,
};

inline constexpr auto kAuditEventKindMappings =
    enum_mappings_t<audit_event_kind_t, 16>{{
        {"ENGINE_INITIALIZED", audit_event_kind_t::engine_initialized},
        {"SANDBOX_ACTION", audit_event_kind_t::sandbox_action},
        {"ACCOUNT_CREATED", audit_event_kind_t::account_created},
        {"TRANSACTION_SIMULATION", audit_event_kind_t::transaction_simulation},
        {"TRANSACTION_COMMITTED", audit_event_kind_t::transaction_committed},
        {"TRANSACTION_REJECTED", audit_event_kind_t::transaction_rejected},
        {"INVALID_INPUT", audit_event_kind_t::invalid_input},
        {"APPROVAL_REQUESTED", audit_event_kind_t::approval_requested},
        {"APPROVAL_GRANTED", audit_event_kind_t::approval_granted},
        {"APPROVAL_DENIED", audit_event_kind_t::approval_denied},
        {"APPROVAL_EXPIRED", audit_event_kind_t::approval_expired},
        {"MODE_TRANSITION", audit_event_kind_t::mode_transition},
        {"COMPLIANCE_VIOLATION", audit_event_kind_t::compliance_violation},
        {"EMERGENCY_STOP_TRIGGERED",
         audit_event_kind_t::emergency_stop_triggered},
        {"EMERGENCY_STOP_CLEARED", audit_event_kind_t::emergency_stop_cleared},
        {"EVIDENCE_RECORD_GENERATED",
         audit_event_kind_t::evidence_record_generated},
    }};

template <>
inline std::optional<audit_event_kind_t> try_from_string<audit_event_kind_t>(
    const std::string_view value) {
  return from_string(value, kAuditEventKindMappings);
}

inline constexpr std::string_view to_string(const audit_event_kind_t value) {
  return to_string(value, kAuditEventKindMappings).value_or("unknown");
}

}  // namespace warden::schema
