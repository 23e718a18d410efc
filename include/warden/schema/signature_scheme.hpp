#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::schema {

// ml_dsa_65 is the reference scheme (FIPS 204, category 3). ed25519 exists
// for OpenSSL builds without an ML-DSA provider and is not quantum resistant.
enum class signature_scheme_t : uint8_t {
  ml_dsa_65 = 1,
  ed25519 = 2,
};

inline constexpr auto kSignatureSchemeMappings =
    enum_mappings_t<signature_scheme_t, 2>{{
        {"ml-dsa-65", signature_scheme_t::ml_dsa_65},
        {"ed25519", signature_scheme_t::ed25519},
    }};

template <>
inline std::optional<signature_scheme_t> try_from_string<signature_scheme_t>(
    const std::string_view value) {
  return from_string(value, kSignatureSchemeMappings);
}

inline constexpr std::string_view to_string(const signature_scheme_t value) {
  return to_string(value, kSignatureSchemeMappings).value_or("unknown");
}

}  // namespace warden::schema
