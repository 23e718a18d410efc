#pragma once

#include <warden/schema/approval_state.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct approval_request;

template <>
struct approval_request<1> final {
  uint16_t version{1};
  std::string request_id;
  std::string transaction_id;
  std::string requested_by;
  timestamp_milliseconds_t requested_at{};
  timestamp_milliseconds_t deadline{};
  approval_state_t state{approval_state_t::pending};
  std::optional<std::string> resolved_by;
};

using approval_request_t = approval_request<1>;

}  // namespace warden::schema
