#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::schema {

enum class approval_state_t : uint8_t {
  pending = 0,
  granted = 1,
  denied = 2,
  expired = 3,
};

inline constexpr auto kApprovalStateMappings =
    enum_mappings_t<approval_state_t, 4>{{
        {"PENDING", approval_state_t::pending},
        {"GRANTED", approval_state_t::granted},
        {"DENIED", approval_state_t::denied},
        {"EXPIRED", approval_state_t::expired},
    }};

template <>
inline std::optional<approval_state_t> try_from_string<approval_state_t>(
    const std::string_view value) {
  return from_string(value, kApprovalStateMappings);
}

inline constexpr std::string_view to_string(const approval_state_t value) {
  return to_string(value, kApprovalStateMappings).value_or("unknown");
}

}  // namespace warden::schema
