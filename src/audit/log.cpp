#include <warden/audit/log.hpp>
#include <warden/common/critical.hpp>
#include <warden/common/error.hpp>
#include <warden/common/random.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace warden::audit {

namespace {

using encoder_t = schema::encoding::scale_encoder_t;

inline constexpr auto kAuditActor = std::string_view{"warden.audit"};

[[noreturn]] void integrity_failure(const uint64_t sequence,
                                    const std::string& reason) {
  spdlog::error("audit: chain integrity violation at entry {}: {}", sequence,
                reason);
  throw common::chain_integrity_violation{sequence, reason};
}

}  // namespace

log::log(log_options options,
         storage_t* storage,
         common::time_source_t now)
    : options_{std::move(options)},
      storage_{storage},
      now_{std::move(now)},
      session_{common::random_hex(4)} {
  auto lock = std::scoped_lock{mutex_};
  if (storage_ != nullptr) {
    load_locked();
  }
}

std::unique_ptr<log> log::restore(log_options options,
                                  std::vector<schema::audit_event_t> events) {
  auto restored = std::make_unique<log>(std::move(options));
  auto lock = std::scoped_lock{restored->mutex_};
  restored->events_ = std::move(events);
  if (!restored->events_.empty()) {
    restored->last_timestamp_ = restored->events_.back().timestamp_ms;
  }
  return restored;
}

void log::load_locked() {
  auto encoder = encoder_t{};
  auto genesis_key = schema::make_bytes(kGenesisKey);
  auto stored_genesis = storage_->get(schema::make_bytes_view(genesis_key));
  if (!stored_genesis) {
    if (!storage_->append(schema::make_bytes_view(genesis_key),
                          options_.genesis_digest)) {
      common::critical("audit: genesis entry appeared during startup");
    }
  } else if (*stored_genesis !=
             schema::bytes_t(std::begin(options_.genesis_digest),
                             std::end(options_.genesis_digest))) {
    integrity_failure(0, "stored genesis digest differs from configuration");
  }

  for (const auto& [key, value] :
       storage_->list_by_prefix(schema::make_bytes_view(kKeyPrefix))) {
    auto public_key = encoder.try_decode<schema::public_key_t>(
        schema::make_bytes_view(value));
    if (!public_key) {
      throw common::error{common::error_code_t::chain_integrity_violation,
                          fmt::format("stored key entry {} cannot be decoded",
                                      schema::make_string(key))};
    }
    key_ring_.push_back(std::move(*public_key));
  }

  for (const auto& [key, value] :
       storage_->list_by_prefix(schema::make_bytes_view(kEventPrefix))) {
    auto event = encoder.try_decode<schema::audit_event_t>(
        schema::make_bytes_view(value));
    if (!event) {
      integrity_failure(events_.size(), "stored entry cannot be decoded");
    }
    events_.push_back(std::move(*event));
  }
  if (!events_.empty()) {
    last_timestamp_ = events_.back().timestamp_ms;
  }
  spdlog::info("audit: reloaded {} events and {} keys (session {})",
               events_.size(), key_ring_.size(), session_);
}

void log::set_signer(event_signer_t signer) {
  auto lock = std::scoped_lock{mutex_};
  signer_ = std::move(signer);
}

void log::register_key(const schema::public_key_t& public_key) {
  auto key_id = crypto::make_key_id(public_key);
  auto lock = std::scoped_lock{mutex_};
  auto known = std::any_of(std::begin(key_ring_), std::end(key_ring_),
                           [&](const schema::public_key_t& candidate) {
                             return crypto::make_key_id(candidate) == key_id;
                           });
  if (known) {
    return;
  }
  if (storage_ != nullptr) {
    auto encoder = encoder_t{};
    auto key = storage::make_key(kKeyPrefix, schema::to_hex(key_id));
    if (!storage_->append(encoder, schema::make_bytes_view(key),
                          public_key)) {
      spdlog::debug("audit: key {} was already persisted",
                    schema::to_hex(key_id));
    }
  }
  key_ring_.push_back(public_key);
}

crypto::key_ring_t log::key_ring() const {
  auto lock = std::scoped_lock{mutex_};
  return key_ring_;
}

schema::audit_event_t log::make_event_locked(
    const schema::audit_event_kind_t kind,
    const std::string& actor,
    schema::payload_t payload,
    const schema::compliance_tier_t tier) {
  auto event = schema::audit_event_t{};
  event.sequence = events_.size();
  event.event_id = fmt::format("AE-{}-{:012}", session_, event.sequence);
  event.kind = kind;
  event.timestamp_ms = std::max(now_(), last_timestamp_);
  event.actor = actor;
  event.payload = std::move(payload);
  event.tier = tier;
  event.previous_digest = head_locked();
  event.digest = schema::compute_event_digest(event);
  if (signer_) {
    event.signature = signer_(event.digest);
  }
  return event;
}

void log::append_locked(const schema::audit_event_t& event) {
  if (storage_ != nullptr) {
    auto encoder = encoder_t{};
    auto key = storage::make_sequence_key(kEventPrefix, event.sequence);
    if (!storage_->append(encoder, schema::make_bytes_view(key), event)) {
      common::critical("audit: entry {} already exists in storage",
                       event.sequence);
    }
  }
  last_timestamp_ = event.timestamp_ms;
  events_.push_back(event);
  ++witnessed_;
}

schema::audit_event_t log::witness(const schema::audit_event_kind_t kind,
                                   const std::string& actor,
                                   schema::payload_t payload,
                                   const schema::compliance_tier_t tier) {
  auto lock = std::scoped_lock{mutex_};
  auto started = std::chrono::steady_clock::now();
  auto event = make_event_locked(kind, actor, std::move(payload), tier);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (elapsed > options_.hard_cap) {
    spdlog::error(
        "audit: {} from '{}' took {}ms, over the {}ms hard cap; dropped",
        schema::to_string(kind), actor, elapsed.count(),
        options_.hard_cap.count());
    auto violation = make_event_locked(
        schema::audit_event_kind_t::compliance_violation,
        std::string{kAuditActor},
        schema::payload_t{
            {"violation", "witness_latency_cap_exceeded"},
            {"dropped_kind", std::string{schema::to_string(kind)}},
            {"dropped_actor", actor},
            {"latency_ms", std::to_string(elapsed.count())},
            {"hard_cap_ms", std::to_string(options_.hard_cap.count())},
        },
        schema::compliance_tier_t::law_tier);
    append_locked(violation);
    ++dropped_;
    throw common::error{
        common::error_code_t::latency_cap_exceeded,
        fmt::format("witnessing {} took {}ms (hard cap {}ms)",
                    schema::to_string(kind), elapsed.count(),
                    options_.hard_cap.count())};
  }
  if (elapsed > options_.soft_target) {
    spdlog::warn("audit: {} from '{}' took {}ms, over the {}ms soft target",
                 schema::to_string(kind), actor, elapsed.count(),
                 options_.soft_target.count());
  }

  append_locked(event);
  spdlog::debug("audit: witnessed {} #{} from '{}'", schema::to_string(kind),
                event.sequence, actor);
  return event;
}

void log::check_range_locked(const schema::log_range_t& range) const {
  if (range.first > range.last || range.last >= events_.size()) {
    throw common::error{
        common::error_code_t::invalid_input,
        fmt::format("range [{}, {}] is outside the log of {} events",
                    range.first, range.last, events_.size())};
  }
}

bool log::verify_chain_locked(const schema::log_range_t& range) const {
  for (auto sequence = range.first; sequence <= range.last; ++sequence) {
    const auto& event = events_[sequence];
    if (event.sequence != sequence) {
      integrity_failure(sequence,
                        fmt::format("entry claims sequence {}", event.sequence));
    }
    const auto& expected_previous = sequence == 0
                                        ? options_.genesis_digest
                                        : events_[sequence - 1].digest;
    if (event.previous_digest != expected_previous) {
      integrity_failure(sequence,
                        "previous link does not match the predecessor digest");
    }
    if (schema::compute_event_digest(event) != event.digest) {
      integrity_failure(sequence,
                        "stored digest does not match the recomputed digest");
    }
  }
  return true;
}

bool log::verify_chain() const {
  auto lock = std::scoped_lock{mutex_};
  if (events_.empty()) {
    return true;
  }
  return verify_chain_locked(
      schema::log_range_t{.first = 0, .last = events_.size() - 1});
}

bool log::verify_chain(const schema::log_range_t& range) const {
  auto lock = std::scoped_lock{mutex_};
  check_range_locked(range);
  return verify_chain_locked(range);
}

bool log::verify_signatures(const schema::log_range_t& range) const {
  return verify_signatures(range, key_ring());
}

bool log::verify_signatures(const schema::log_range_t& range,
                            const crypto::key_ring_t& ring) const {
  auto lock = std::scoped_lock{mutex_};
  check_range_locked(range);
  for (auto sequence = range.first; sequence <= range.last; ++sequence) {
    const auto& event = events_[sequence];
    if (!event.signature) {
      integrity_failure(sequence, "entry is not signed");
    }
    if (!crypto::verify_envelope(event.digest, *event.signature, ring)) {
      integrity_failure(sequence,
                        "signature does not verify against the key ring");
    }
  }
  return true;
}

schema::hash32_t log::head_locked() const {
  if (events_.empty()) {
    return options_.genesis_digest;
  }
  return events_.back().digest;
}

schema::hash32_t log::head() const {
  auto lock = std::scoped_lock{mutex_};
  return head_locked();
}

uint64_t log::size() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.size();
}

std::vector<schema::audit_event_t> log::latest(const std::size_t count) const {
  auto lock = std::scoped_lock{mutex_};
  auto first = events_.size() > count ? events_.size() - count : 0;
  return std::vector<schema::audit_event_t>(
      std::next(std::begin(events_), static_cast<std::ptrdiff_t>(first)),
      std::end(events_));
}

std::vector<schema::audit_event_t> log::range(
    const schema::log_range_t& range) const {
  auto lock = std::scoped_lock{mutex_};
  check_range_locked(range);
  return std::vector<schema::audit_event_t>(
      std::next(std::begin(events_), static_cast<std::ptrdiff_t>(range.first)),
      std::next(std::begin(events_),
                static_cast<std::ptrdiff_t>(range.last + 1)));
}

std::optional<schema::audit_event_t> log::at(const uint64_t sequence) const {
  auto lock = std::scoped_lock{mutex_};
  if (sequence >= events_.size()) {
    return std::nullopt;
  }
  return events_[sequence];
}

std::vector<schema::audit_event_t> log::events() const {
  auto lock = std::scoped_lock{mutex_};
  return events_;
}

schema::bytes_t log::export_events() const {
  return schema::encode_events(events());
}

log_statistics log::statistics() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = log_statistics{.witnessed = witnessed_,
                            .dropped = dropped_,
                            .size = events_.size(),
                            .head = head_locked()};
  for (const auto& event : events_) {
    ++out.by_tier[event.tier];
  }
  out.intact = true;
  if (!events_.empty()) {
    try {
      verify_chain_locked(
          schema::log_range_t{.first = 0, .last = events_.size() - 1});
    } catch (const common::chain_integrity_violation&) {
      // Already logged with the first broken entry.
      out.intact = false;
    }
  }
  return out;
}

}  // namespace warden::audit
