#pragma once

#include <warden/audit/event_signer.hpp>
#include <warden/common/clock.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/schema/audit_event.hpp>
#include <warden/schema/evidence_record.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::audit {

using storage_t = storage::storage<storage::rocksdb_storage_tag>;

inline constexpr auto kEventPrefix = std::string_view{"AUD|"};
inline constexpr auto kEvidencePrefix = std::string_view{"EVR|"};
inline constexpr auto kKeyPrefix = std::string_view{"KEY|"};
inline constexpr auto kGenesisKey = std::string_view{"SYS|GENESIS"};

struct log_options final {
  schema::hash32_t genesis_digest{};
  std::chrono::milliseconds soft_target{50};
  std::chrono::milliseconds hard_cap{500};
};

struct log_statistics final {
  /// Events appended by this process, violations included.
  uint64_t witnessed{0};
  /// Appends dropped at the hard cap by this process.
  uint64_t dropped{0};
  uint64_t size{0};
  schema::hash32_t head{};
  std::map<schema::compliance_tier_t, uint64_t> by_tier;
  bool intact{false};
};

/// Append-only hash chain of audit events.
///
/// Every append runs under one mutex: the event is sequenced, timestamped
/// (never earlier than its predecessor), digested over its fields and the
/// previous digest, signed, timed against the latency budget and durably
/// appended before the head advances.
class log final {
 public:
  /// With `storage`, persisted events and keys are reloaded as stored and
  /// every new event is appended there before `witness` returns. Throws
  /// `chain_integrity_violation` when the stored genesis differs from
  /// `options.genesis_digest`.
  explicit log(log_options options,
               storage_t* storage = nullptr,
               common::time_source_t now = common::system_time_source());

  log(const log&) = delete;
  log& operator=(const log&) = delete;

  /// In-memory log holding `events` exactly as given, for re-verification
  /// of an exported chain.
  static std::unique_ptr<log> restore(log_options options,
                                      std::vector<schema::audit_event_t> events);

  void set_signer(event_signer_t signer);

  /// Adds a verification key to the ring (and to storage, when present).
  void register_key(const schema::public_key_t& public_key);
  crypto::key_ring_t key_ring() const;

  /// Throws `latency_cap_exceeded` after recording a compliance violation
  /// when the append exceeds the hard cap.
  schema::audit_event_t witness(schema::audit_event_kind_t kind,
                                const std::string& actor,
                                schema::payload_t payload,
                                schema::compliance_tier_t tier);

  /// True for the empty log. Throws `chain_integrity_violation` naming the
  /// first broken entry.
  bool verify_chain() const;
  bool verify_chain(const schema::log_range_t& range) const;

  /// Every event in range must be signed by a key in the ring.
  bool verify_signatures(const schema::log_range_t& range) const;
  bool verify_signatures(const schema::log_range_t& range,
                         const crypto::key_ring_t& ring) const;

  schema::hash32_t head() const;
  const schema::hash32_t& genesis() const { return options_.genesis_digest; }
  uint64_t size() const;
  const log_options& options() const { return options_; }

  std::vector<schema::audit_event_t> latest(std::size_t count) const;
  /// Throws `invalid_input` for a range outside the log.
  std::vector<schema::audit_event_t> range(
      const schema::log_range_t& range) const;
  std::optional<schema::audit_event_t> at(uint64_t sequence) const;
  std::vector<schema::audit_event_t> events() const;

  /// SCALE encoding of the whole chain.
  schema::bytes_t export_events() const;

  /// Counters, per-tier breakdown and a full digest-link check.
  log_statistics statistics() const;

 private:
  schema::audit_event_t make_event_locked(schema::audit_event_kind_t kind,
                                          const std::string& actor,
                                          schema::payload_t payload,
                                          schema::compliance_tier_t tier);
  void append_locked(const schema::audit_event_t& event);
  void load_locked();
  void check_range_locked(const schema::log_range_t& range) const;
  bool verify_chain_locked(const schema::log_range_t& range) const;
  schema::hash32_t head_locked() const;

  log_options options_;
  storage_t* storage_;
  common::time_source_t now_;
  std::string session_;

  mutable std::mutex mutex_;
  std::vector<schema::audit_event_t> events_;
  crypto::key_ring_t key_ring_;
  event_signer_t signer_;
  schema::timestamp_milliseconds_t last_timestamp_{};
  uint64_t witnessed_{0};
  uint64_t dropped_{0};
};

}  // namespace warden::audit
