#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Exact decimal amount stored as a count of minor units (10^-kAmountScale).
/// Signed so that malformed negative requests can be represented and refused.
using amount_t = boost::multiprecision::checked_int256_t;

inline constexpr auto kAmountScale = 2u;
inline constexpr auto kAmountUnit = 100;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(std::string_view hex);
hash32_t make_zero_hash();

/// Parse "1234.5", "-10.00" or "7" into minor units. More than
/// kAmountScale fractional digits, stray characters or an empty integer
/// part yield std::nullopt.
std::optional<amount_t> parse_amount(std::string_view text);

/// Like parse_amount, but throws `invalid_input` naming the text.
amount_t make_amount(std::string_view text);

/// Canonical text form with exactly kAmountScale fractional digits.
std::string format_amount(const amount_t& amount);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
