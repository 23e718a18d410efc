#pragma once

#include <warden/schema/compliance_tier.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace warden::schema {

/// Inclusive range of audit log sequences.
struct log_range_t final {
  uint64_t first{};
  uint64_t last{};

  uint64_t count() const { return last - first + 1; }
};

template <uint16_t Version>
struct evidence_record;

template <>
struct evidence_record<1> final {
  uint16_t version{1};
  std::string record_id;
  log_range_t range;
  // Attested compliance level, bound into range_digest.
  compliance_tier_t tier{compliance_tier_t::law_tier};
  hash32_t range_digest{};
  bytes_t signature;
  std::string signer_id;
  hash32_t key_id{};
  timestamp_milliseconds_t created_at{};
};

using evidence_record_t = evidence_record<1>;

}  // namespace warden::schema
