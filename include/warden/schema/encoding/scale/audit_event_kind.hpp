#pragma once

#include <warden/schema/audit_event_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    audit_event_kind_t,
    warden::schema::audit_event_kind_t::engine_initialized,
    warden::schema::audit_event_kind_t::sandbox_action,
    warden::schema::audit_event_kind_t::account_created,
    warden::schema::audit_event_kind_t::transaction_simulation,
    warden::schema::audit_event_kind_t::transaction_committed,
    warden::schema::audit_event_kind_t::transaction_rejected,
    warden::schema::audit_event_kind_t::invalid_input,
    warden::schema::audit_event_kind_t::approval_requested,
    warden::schema::audit_event_kind_t::approval_granted,
    warden::schema::audit_event_kind_t::approval_denied,
    warden::schema::audit_event_kind_t::approval_expired,
    warden::schema::audit_event_kind_t::mode_transition,
    warden::schema::audit_event_kind_t::compliance_violation,
    warden::schema::audit_event_kind_t::emergency_stop_triggered,
    warden::schema::audit_event_kind_t::emergency_stop_cleared,
    warden::schema::audit_event_kind_t::evidence_record_generated)
