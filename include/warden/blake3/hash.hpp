#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace warden::blake3 {

schema::hash32_t hash(const std::string_view& str);
schema::hash32_t hash(const schema::bytes_view_t& bytes);

/// Digest of the concatenation of `parts`, without materializing it.
schema::hash32_t hash(std::initializer_list<schema::bytes_view_t> parts);

}  // namespace warden::blake3
