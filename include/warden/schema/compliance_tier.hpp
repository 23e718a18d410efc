#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: compliance tier.
// Declared weight of an audit event. Values are ordered so that the
// built-in comparisons give LAW > POLICY > ADVISORY > INFORMATIONAL.
namespace warden::schema {

enum class compliance_tier_t : uint8_t {
  informational_tier = 0,
  advisory_tier = 1,
  policy_tier = 2,
  law_tier = 3,
};

inline constexpr auto kComplianceTierMappings =
    enum_mappings_t<compliance_tier_t, 4>{{
        {"INFORMATIONAL_TIER", compliance_tier_t::informational_tier},
        {"ADVISORY_TIER", compliance_tier_t::advisory_tier},
        {"POLICY_TIER", compliance_tier_t::policy_tier},
        {"LAW_TIER", compliance_tier_t::law_tier},
    }};

template <>
inline std::optional<compliance_tier_t> try_from_string<compliance_tier_t>(
    const std::string_view value) {
  return from_string(value, kComplianceTierMappings);
}

inline constexpr std::string_view to_string(const compliance_tier_t value) {
  return to_string(value, kComplianceTierMappings).value_or("unknown");
}

}  // namespace warden::schema
