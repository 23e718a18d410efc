#include <warden/blake3/hash.hpp>
#include <warden/schema/audit_event.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace warden::schema {

std::optional<std::string_view> find_field(const payload_t& payload,
                                           const std::string_view key) {
  for (const auto& field : payload) {
    if (field.key == key) {
      return std::string_view{field.value};
    }
  }
  return std::nullopt;
}

hash32_t compute_event_digest(const audit_event_t& event) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{event.version, event.sequence, event.event_id, event.kind,
                 event.timestamp_ms, event.actor, event.payload, event.tier,
                 event.previous_digest});
  return blake3::hash(make_bytes_view(encoded));
}

bytes_t encode_events(const std::vector<audit_event_t>& events) {
  auto encoder = encoding::scale_encoder_t{};
  return encoder.encode(events);
}

std::optional<std::vector<audit_event_t>> decode_events(
    const bytes_view_t& bytes) {
  auto encoder = encoding::scale_encoder_t{};
  return encoder.try_decode<std::vector<audit_event_t>>(bytes);
}

}  // namespace warden::schema
