#pragma once

#include <warden/schema/execution_mode.hpp>
#include <warden/schema/primitives.hpp>

#include <string>

namespace warden::schema {

/// External approval for one mode promotion. `signature` covers
/// make_promotion_digest(from, to, approver_id, issued_at).
template <uint16_t Version>
struct approval_token;

template <>
struct approval_token<1> final {
  uint16_t version{1};
  execution_mode_t from{execution_mode_t::shadow};
  execution_mode_t to{execution_mode_t::pilot};
  std::string approver_id;
  timestamp_milliseconds_t issued_at{};
  bytes_t signature;
};

using approval_token_t = approval_token<1>;

}  // namespace warden::schema
