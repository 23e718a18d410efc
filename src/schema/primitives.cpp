#include <warden/common/critical.hpp>
#include <warden/common/error.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace warden::schema {

namespace {

// Keeps parsed values far inside the range of checked_int256_t.
constexpr auto kMaxIntegerDigits = std::size_t{60};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

bool all_digits(const std::string_view text) {
  return std::all_of(std::begin(text), std::end(text),
                     [](const char c) { return c >= '0' && c <= '9'; });
}

amount_t digits_to_amount(const std::string_view digits) {
  auto value = amount_t{0};
  for (const auto c : digits) {
    value = (value * 10) + (c - '0');
  }
  return value;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<amount_t> parse_amount(std::string_view text) {
  auto negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  auto integer_part = text;
  auto fraction_part = std::string_view{};
  if (auto dot = text.find('.'); dot != std::string_view::npos) {
    integer_part = text.substr(0, dot);
    fraction_part = text.substr(dot + 1);
    if (fraction_part.empty()) {
      return std::nullopt;
    }
  }

  if (integer_part.empty() || integer_part.size() > kMaxIntegerDigits ||
      fraction_part.size() > kAmountScale || !all_digits(integer_part) ||
      !all_digits(fraction_part)) {
    return std::nullopt;
  }

  auto value = digits_to_amount(integer_part) * kAmountUnit;
  auto fraction = digits_to_amount(fraction_part);
  for (auto i = fraction_part.size(); i < kAmountScale; ++i) {
    fraction *= 10;
  }
  value += fraction;
  return negative ? amount_t{-value} : value;
}

amount_t make_amount(const std::string_view text) {
  auto parsed = parse_amount(text);
  if (!parsed) {
    throw common::error{common::error_code_t::invalid_input,
                        "malformed amount '" + std::string{text} + "'"};
  }
  return *parsed;
}

std::string format_amount(const amount_t& amount) {
  auto magnitude = amount < 0 ? amount_t{-amount} : amount;
  auto whole = amount_t{magnitude / kAmountUnit};
  auto fraction = (magnitude % kAmountUnit).convert_to<int>();

  auto out = std::string{};
  if (amount < 0) {
    out.push_back('-');
  }
  out += whole.str();
  out.push_back('.');
  out.push_back(static_cast<char>('0' + (fraction / 10)));
  out.push_back(static_cast<char>('0' + (fraction % 10)));
  return out;
}

}  // namespace warden::schema
