#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace warden::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const warden::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline warden::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  bool append(const warden::schema::bytes_view_t& key,
              const warden::schema::bytes_view_t& value);

  template <typename Encoder, typename T>
  bool append(Encoder& encoder,
              const warden::schema::bytes_view_t& key,
              const T& value);

  std::optional<warden::schema::bytes_t> get(
      const warden::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
bool storage<rocksdb_storage_tag>::append(
    Encoder& encoder,
    const warden::schema::bytes_view_t& key,
    const T& value) {
  auto encoded = encoder.encode(value);
  return append(key, warden::schema::make_bytes_view(encoded));
}

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const warden::schema::bytes_view_t& key) const {
  auto value = get(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(warden::schema::make_bytes_view(*value))};
}

}  // namespace warden::storage
