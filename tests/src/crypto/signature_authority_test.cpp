#include <warden/blake3/hash.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/testing/common.hpp>
#include <gtest/gtest.h>

#include <vector>

using warden::schema::signature_scheme_t;

namespace {

class signature_authority_test
    : public ::testing::TestWithParam<signature_scheme_t> {
 protected:
  void SetUp() override {
    if (!warden::crypto::available(GetParam())) {
      GTEST_SKIP() << warden::schema::to_string(GetParam())
                   << " is not provided by the linked OpenSSL";
    }
  }
};

}  // namespace

TEST_P(signature_authority_test, sign_then_verify_round_trips) {
  auto authority = warden::crypto::signature_authority{"auditor", GetParam()};
  EXPECT_EQ(authority.scheme(), GetParam());
  EXPECT_EQ(authority.public_key().scheme, GetParam());
  for (uint8_t seed : {0, 1, 42, 200}) {
    auto digest = warden::testing::make_hash(seed);
    auto signature = authority.sign(digest);
    EXPECT_TRUE(warden::crypto::verify(
        digest, warden::schema::make_bytes_view(signature),
        authority.public_key()));
  }
}

TEST_P(signature_authority_test, single_bit_mutations_fail_verification) {
  auto authority = warden::crypto::signature_authority{"auditor", GetParam()};
  auto digest = warden::testing::make_hash(9);
  auto signature = authority.sign(digest);

  for (auto bit : {0u, 7u, 100u, 255u}) {
    auto mutated = digest;
    mutated[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
    EXPECT_FALSE(warden::crypto::verify(
        mutated, warden::schema::make_bytes_view(signature),
        authority.public_key()));
  }

  for (auto index : std::vector<std::size_t>{0, signature.size() / 2,
                                             signature.size() - 1}) {
    auto mutated = signature;
    mutated[index] ^= 0x01;
    EXPECT_FALSE(warden::crypto::verify(
        digest, warden::schema::make_bytes_view(mutated),
        authority.public_key()));
  }
}

TEST_P(signature_authority_test, other_keys_and_malformed_input_do_not_verify) {
  auto authority = warden::crypto::signature_authority{"auditor", GetParam()};
  auto other = warden::crypto::signature_authority{"intruder", GetParam()};
  auto digest = warden::testing::make_hash(3);
  auto signature = authority.sign(digest);

  EXPECT_NE(authority.key_id(), other.key_id());
  EXPECT_FALSE(warden::crypto::verify(
      digest, warden::schema::make_bytes_view(signature), other.public_key()));
  EXPECT_FALSE(warden::crypto::verify(digest, {}, authority.public_key()));

  auto truncated = authority.public_key();
  truncated.key.resize(truncated.key.size() / 2);
  EXPECT_FALSE(warden::crypto::verify(
      digest, warden::schema::make_bytes_view(signature), truncated));
}

TEST_P(signature_authority_test, envelopes_resolve_keys_from_the_ring) {
  auto authority = warden::crypto::signature_authority{"auditor", GetParam()};
  auto other = warden::crypto::signature_authority{"intruder", GetParam()};
  auto digest = warden::testing::make_hash(77);
  auto envelope = authority.sign_envelope(digest);

  EXPECT_EQ(envelope.key_id, authority.key_id());
  EXPECT_EQ(authority.key_id(),
            warden::blake3::hash(
                warden::schema::make_bytes_view(authority.public_key().key)));
  EXPECT_TRUE(warden::crypto::verify_envelope(
      digest, envelope,
      warden::crypto::key_ring_t{other.public_key(), authority.public_key()}));
  EXPECT_FALSE(warden::crypto::verify_envelope(
      digest, envelope, warden::crypto::key_ring_t{other.public_key()}));
  EXPECT_FALSE(
      warden::crypto::verify_envelope(digest, envelope, {}));
}

INSTANTIATE_TEST_SUITE_P(schemes,
                         signature_authority_test,
                         ::testing::Values(signature_scheme_t::ml_dsa_65,
                                           signature_scheme_t::ed25519));

TEST(signature_authority, ml_dsa_65_uses_fips_204_sizes) {
  if (!warden::crypto::available(signature_scheme_t::ml_dsa_65)) {
    GTEST_SKIP() << "ML-DSA-65 is not provided by the linked OpenSSL";
  }
  auto authority =
      warden::crypto::signature_authority{"auditor", signature_scheme_t::ml_dsa_65};
  EXPECT_EQ(authority.public_key().key.size(), 1952u);
  EXPECT_EQ(authority.sign(warden::testing::make_hash(1)).size(), 3309u);
}

TEST(signature_authority, ed25519_is_always_available) {
  EXPECT_TRUE(warden::crypto::available(signature_scheme_t::ed25519));
  auto authority =
      warden::crypto::signature_authority{"auditor", signature_scheme_t::ed25519};
  EXPECT_EQ(authority.public_key().key.size(), 32u);
  EXPECT_EQ(authority.sign(warden::testing::make_hash(1)).size(), 64u);
}
