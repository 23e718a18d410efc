#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: execution mode.
// Governance workflow: the tier the sandbox is operating at. Tiers are
// ordered; promotion moves exactly one tier up and never down.
namespace warden::schema {

enum class execution_mode_t : uint8_t {
  shadow = 0,
  pilot = 1,
  production = 2,
};

inline constexpr auto kExecutionModeMappings =
    enum_mappings_t<execution_mode_t, 3>{{
        {"SHADOW", execution_mode_t::shadow},
        {"PILOT", execution_mode_t::pilot},
        {"PRODUCTION", execution_mode_t::production},
    }};

template <>
inline std::optional<execution_mode_t> try_from_string<execution_mode_t>(
    const std::string_view value) {
  return from_string(value, kExecutionModeMappings);
}

inline constexpr std::string_view to_string(const execution_mode_t value) {
  return to_string(value, kExecutionModeMappings).value_or("unknown");
}

/// The only mode reachable from `mode` by promotion, if any.
constexpr std::optional<execution_mode_t> next_mode(
    const execution_mode_t mode) {
  switch (mode) {
    case execution_mode_t::shadow:
      return execution_mode_t::pilot;
    case execution_mode_t::pilot:
      return execution_mode_t::production;
    case execution_mode_t::production:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace warden::schema
