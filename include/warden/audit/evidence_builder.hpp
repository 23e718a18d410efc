#pragma once

#include <warden/audit/log.hpp>
#include <warden/common/clock.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/schema/audit_event.hpp>
#include <warden/schema/evidence_record.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace warden::audit {

/// BLAKE3 over the SCALE encoding of the range bounds, the attested tier
/// and the digests recomputed from each event's fields.
schema::hash32_t compute_range_digest(
    const schema::log_range_t& range,
    schema::compliance_tier_t tier,
    const std::vector<schema::audit_event_t>& events);

/// Builds signed, immutable summaries of audit log ranges.
class evidence_builder final {
 public:
  evidence_builder(log& audit_log,
                   const crypto::signature_authority& authority,
                   storage_t* storage = nullptr,
                   common::time_source_t now = common::system_time_source());

  evidence_builder(const evidence_builder&) = delete;
  evidence_builder& operator=(const evidence_builder&) = delete;

  /// Verifies the range, signs its digest, witnesses
  /// `evidence_record_generated` and only then persists and publishes the
  /// record. Throws `invalid_input` for a range outside the log,
  /// `chain_integrity_violation` for a broken one and whatever the witness
  /// throws, in which case no record exists.
  schema::evidence_record_t build_record(
      const schema::log_range_t& range,
      schema::compliance_tier_t tier = schema::compliance_tier_t::law_tier);

  /// Pure predicate over the current log contents.
  bool verify_record(const schema::evidence_record_t& record,
                     const crypto::key_ring_t& ring) const;
  bool verify_record(const schema::evidence_record_t& record) const;

  std::optional<schema::evidence_record_t> latest() const;
  std::vector<schema::evidence_record_t> records() const;
  std::size_t size() const;

 private:
  log& log_;
  const crypto::signature_authority& authority_;
  storage_t* storage_;
  common::time_source_t now_;

  mutable std::mutex mutex_;
  std::vector<schema::evidence_record_t> records_;
};

}  // namespace warden::audit
