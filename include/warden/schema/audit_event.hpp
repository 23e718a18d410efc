#pragma once

#include <warden/schema/audit_event_kind.hpp>
#include <warden/schema/compliance_tier.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/public_key.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

struct payload_field_t final {
  std::string key;
  std::string value;
};

/// Ordered key/value fields. Order is part of the digest.
using payload_t = std::vector<payload_field_t>;

std::optional<std::string_view> find_field(const payload_t& payload,
                                           std::string_view key);

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string event_id;
  audit_event_kind_t kind{audit_event_kind_t::sandbox_action};
  timestamp_milliseconds_t timestamp_ms{};
  std::string actor;
  payload_t payload;
  compliance_tier_t tier{compliance_tier_t::informational_tier};
  hash32_t previous_digest{};
  hash32_t digest{};
  std::optional<signature_envelope_t> signature;
};

using audit_event_t = audit_event<1>;

/// BLAKE3 over the SCALE encoding of every field except `digest` and
/// `signature`.
hash32_t compute_event_digest(const audit_event_t& event);

bytes_t encode_events(const std::vector<audit_event_t>& events);
std::optional<std::vector<audit_event_t>> decode_events(
    const bytes_view_t& bytes);

}  // namespace warden::schema
