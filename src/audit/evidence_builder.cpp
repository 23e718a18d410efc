#include <warden/audit/evidence_builder.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/common/error.hpp>
#include <warden/common/random.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <tuple>
#include <utility>

namespace warden::audit {

namespace {

using encoder_t = schema::encoding::scale_encoder_t;

inline constexpr auto kRangeDomain = std::string_view{"warden-evidence-v1"};

}  // namespace

schema::hash32_t compute_range_digest(
    const schema::log_range_t& range,
    const schema::compliance_tier_t tier,
    const std::vector<schema::audit_event_t>& events) {
  auto digests = std::vector<schema::hash32_t>{};
  digests.reserve(events.size());
  for (const auto& event : events) {
    digests.push_back(schema::compute_event_digest(event));
  }
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{
      std::string{kRangeDomain}, range.first, range.last, tier, digests});
  return blake3::hash(schema::make_bytes_view(encoded));
}

evidence_builder::evidence_builder(log& audit_log,
                                   const crypto::signature_authority& authority,
                                   storage_t* storage,
                                   common::time_source_t now)
    : log_{audit_log},
      authority_{authority},
      storage_{storage},
      now_{std::move(now)} {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = encoder_t{};
  for (const auto& [key, value] :
       storage_->list_by_prefix(schema::make_bytes_view(kEvidencePrefix))) {
    auto record = encoder.try_decode<schema::evidence_record_t>(
        schema::make_bytes_view(value));
    if (!record) {
      throw common::error{
          common::error_code_t::chain_integrity_violation,
          fmt::format("stored evidence record {} cannot be decoded",
                      records_.size())};
    }
    records_.push_back(std::move(*record));
  }
  if (!records_.empty()) {
    spdlog::info("evidence: reloaded {} records", records_.size());
  }
}

schema::evidence_record_t evidence_builder::build_record(
    const schema::log_range_t& range,
    const schema::compliance_tier_t tier) {
  auto lock = std::scoped_lock{mutex_};
  log_.verify_chain(range);
  auto events = log_.range(range);

  auto record = schema::evidence_record_t{};
  record.record_id = "BER-" + common::random_hex(16);
  record.range = range;
  record.tier = tier;
  record.range_digest = compute_range_digest(range, tier, events);
  record.signature = authority_.sign(record.range_digest);
  record.signer_id = authority_.signer_id();
  record.key_id = authority_.key_id();
  record.created_at = now_();

  // A record whose generation could not be witnessed is never published.
  log_.witness(schema::audit_event_kind_t::evidence_record_generated,
               authority_.signer_id(),
               schema::payload_t{
                   {"record_id", record.record_id},
                   {"first", std::to_string(range.first)},
                   {"last", std::to_string(range.last)},
                   {"tier", std::string{schema::to_string(tier)}},
                   {"range_digest", schema::to_hex(record.range_digest)},
                   {"key_id", schema::to_hex(record.key_id)},
               },
               schema::compliance_tier_t::law_tier);

  if (storage_ != nullptr) {
    auto encoder = encoder_t{};
    auto key = storage::make_sequence_key(kEvidencePrefix, records_.size());
    if (!storage_->append(encoder, schema::make_bytes_view(key), record)) {
      common::critical("evidence: record slot {} already exists in storage",
                       records_.size());
    }
  }
  records_.push_back(record);
  spdlog::info("evidence: {} covers [{}, {}] at {}", record.record_id,
               range.first, range.last, schema::to_string(tier));
  return record;
}

bool evidence_builder::verify_record(const schema::evidence_record_t& record,
                                     const crypto::key_ring_t& ring) const {
  if (record.range.first > record.range.last ||
      record.range.last >= log_.size()) {
    return false;
  }
  auto events = log_.range(record.range);
  if (compute_range_digest(record.range, record.tier, events) !=
      record.range_digest) {
    return false;
  }
  return crypto::verify_envelope(
      record.range_digest,
      schema::signature_envelope_t{.key_id = record.key_id,
                                   .signature = record.signature},
      ring);
}

bool evidence_builder::verify_record(
    const schema::evidence_record_t& record) const {
  return verify_record(record, log_.key_ring());
}

std::optional<schema::evidence_record_t> evidence_builder::latest() const {
  auto lock = std::scoped_lock{mutex_};
  if (records_.empty()) {
    return std::nullopt;
  }
  return records_.back();
}

std::vector<schema::evidence_record_t> evidence_builder::records() const {
  auto lock = std::scoped_lock{mutex_};
  return records_;
}

std::size_t evidence_builder::size() const {
  auto lock = std::scoped_lock{mutex_};
  return records_.size();
}

}  // namespace warden::audit
