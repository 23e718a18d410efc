#include <boost/endian/buffers.hpp>
#include <warden/common/critical.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <iterator>
#include <string>

namespace warden::storage {

warden::schema::bytes_t make_sequence_key(const std::string_view prefix,
                                          const uint64_t sequence) {
  auto key = warden::schema::make_bytes(prefix);
  auto encoded = boost::endian::big_uint64_buf_t{sequence};
  key.insert(std::end(key), encoded.data(), encoded.data() + sizeof(encoded));
  return key;
}

warden::schema::bytes_t make_key(const std::string_view prefix,
                                 const std::string_view suffix) {
  auto key = warden::schema::make_bytes(prefix);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    warden::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::append(
    const warden::schema::bytes_view_t& key,
    const warden::schema::bytes_view_t& value) {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto existing = std::string{};
  auto lookup = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &existing);
  if (lookup.ok()) {
    return false;
  }
  if (!lookup.IsNotFound()) {
    spdlog::error("Failed to look up key in RocksDB: {}", lookup.ToString());
    warden::common::critical("Failed to look up key in RocksDB");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status =
      database->Put(write_options, detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to append value into RocksDB: {}",
                  status.ToString());
    warden::common::critical("Failed to append value into RocksDB");
  }
  return true;
}

std::optional<warden::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const warden::schema::bytes_view_t& key) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    warden::common::critical("Failed to get value from RocksDB");
  }
  return warden::schema::make_bytes(std::string_view{value});
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Failed to iterate RocksDB: {}",
                  iterator->status().ToString());
    warden::common::critical("Failed to iterate RocksDB");
  }
  return entries;
}

}  // namespace warden::storage
