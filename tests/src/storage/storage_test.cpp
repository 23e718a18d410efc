#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/public_key.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/storage/storage.hpp>
#include <warden/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using storage_t = warden::storage::storage<warden::storage::rocksdb_storage_tag>;
using encoder_t = warden::schema::encoding::scale_encoder_t;

std::string key_text(const warden::schema::bytes_t& key) {
  return warden::schema::make_string(warden::schema::make_bytes_view(key));
}

}  // namespace

TEST(storage, sequence_keys_are_big_endian) {
  auto key = warden::storage::make_sequence_key("AUD|", 0x0102030405060708ull);
  ASSERT_EQ(key.size(), 12u);
  EXPECT_EQ(key_text(warden::schema::bytes_t(key.begin(), key.begin() + 4)),
            "AUD|");
  EXPECT_EQ(key[4], 0x01);
  EXPECT_EQ(key[11], 0x08);
}

TEST(storage, append_refuses_existing_keys) {
  auto db = warden::testing::make_db_path("warden_storage_append");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto key = warden::storage::make_key("SYS|", "alpha");
    auto first = warden::schema::bytes_t{0x01};
    auto second = warden::schema::bytes_t{0x02};

    EXPECT_FALSE(storage.get(warden::schema::make_bytes_view(key)).has_value());
    EXPECT_TRUE(storage.append(warden::schema::make_bytes_view(key),
                               warden::schema::make_bytes_view(first)));
    EXPECT_FALSE(storage.append(warden::schema::make_bytes_view(key),
                                warden::schema::make_bytes_view(second)));
    EXPECT_EQ(storage.get(warden::schema::make_bytes_view(key)), first);
  }
  warden::testing::remove_path(db);
}

TEST(storage, prefix_listing_follows_sequence_order) {
  auto db = warden::testing::make_db_path("warden_storage_prefix");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    for (auto sequence : {256ull, 1ull, 2ull, 65536ull}) {
      auto key = warden::storage::make_sequence_key("AUD|", sequence);
      auto value = warden::schema::make_bytes(std::to_string(sequence));
      ASSERT_TRUE(storage.append(warden::schema::make_bytes_view(key),
                                 warden::schema::make_bytes_view(value)));
    }
    auto other = warden::storage::make_key("EVR|", "x");
    ASSERT_TRUE(storage.append(warden::schema::make_bytes_view(other),
                               warden::schema::make_bytes_view(other)));

    auto entries = storage.list_by_prefix(
        warden::schema::make_bytes_view(std::string_view{"AUD|"}));
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(key_text(entries[0].second), "1");
    EXPECT_EQ(key_text(entries[1].second), "2");
    EXPECT_EQ(key_text(entries[2].second), "256");
    EXPECT_EQ(key_text(entries[3].second), "65536");
  }
  warden::testing::remove_path(db);
}

TEST(storage, encoded_values_round_trip) {
  auto db = warden::testing::make_db_path("warden_storage_encoded");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = warden::storage::make_key("KEY|", "k1");
    auto value = warden::schema::public_key_t{
        .scheme = warden::schema::signature_scheme_t::ed25519,
        .key = warden::schema::bytes_t{1, 2, 3}};
    ASSERT_TRUE(
        storage.append(encoder, warden::schema::make_bytes_view(key), value));

    auto loaded = storage.get<encoder_t, warden::schema::public_key_t>(
        encoder, warden::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->scheme, warden::schema::signature_scheme_t::ed25519);
    EXPECT_EQ(loaded->key, value.key);
  }
  warden::testing::remove_path(db);
}
