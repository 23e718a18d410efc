#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

/// Append-only key/value keyspace. Entries are written once and never
/// overwritten or deleted through this interface.
template <typename Library>
struct storage {
  /// Durably write value at key. Returns false, writing nothing, when the
  /// key already exists. Callers serialize appends to the same keyspace.
  bool append(const warden::schema::bytes_view_t& key,
              const warden::schema::bytes_view_t& value);

  /// Encode value and append it at key.
  template <typename Encoder, typename T>
  bool append(Encoder& encoder,
              const warden::schema::bytes_view_t& key,
              const T& value);

  /// Raw value at key, or std::nullopt when missing.
  std::optional<warden::schema::bytes_t> get(
      const warden::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// prefix || big-endian sequence, so that key order is sequence order.
warden::schema::bytes_t make_sequence_key(std::string_view prefix,
                                          uint64_t sequence);

/// prefix || suffix.
warden::schema::bytes_t make_key(std::string_view prefix,
                                 std::string_view suffix);

}  // namespace warden::storage
