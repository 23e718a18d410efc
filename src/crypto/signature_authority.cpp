#include <warden/blake3/hash.hpp>
#include <warden/common/error.hpp>
#include <warden/crypto/signature_authority.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const char* algorithm_name(const schema::signature_scheme_t scheme) {
  switch (scheme) {
    case schema::signature_scheme_t::ml_dsa_65:
      return "ML-DSA-65";
    case schema::signature_scheme_t::ed25519:
      return "ED25519";
  }
  return "";
}

bool provider_loads(const schema::signature_scheme_t scheme) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, algorithm_name(scheme), nullptr),
      EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return EVP_PKEY_keygen_init(ctx.get()) == 1;
}

evp_pkey_ptr generate_key(const schema::signature_scheme_t scheme) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, algorithm_name(scheme), nullptr),
      EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw common::error{common::error_code_t::crypto_failure,
                        fmt::format("{} is not provided by this OpenSSL build",
                                    algorithm_name(scheme))};
  }
  auto* raw_key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_generate(ctx.get(), &raw_key) != 1) {
    throw common::error{
        common::error_code_t::crypto_failure,
        fmt::format("{} key generation failed", algorithm_name(scheme))};
  }
  return evp_pkey_ptr{raw_key, EVP_PKEY_free};
}

schema::bytes_t export_public_key(EVP_PKEY* key) {
  auto length = std::size_t{};
  if (EVP_PKEY_get_raw_public_key(key, nullptr, &length) != 1) {
    throw common::error{common::error_code_t::crypto_failure,
                        "unable to size raw public key"};
  }
  auto bytes = schema::bytes_t(length);
  if (EVP_PKEY_get_raw_public_key(key, bytes.data(), &length) != 1) {
    throw common::error{common::error_code_t::crypto_failure,
                        "unable to export raw public key"};
  }
  bytes.resize(length);
  return bytes;
}

}  // namespace

bool available(const schema::signature_scheme_t scheme) {
  switch (scheme) {
    case schema::signature_scheme_t::ml_dsa_65: {
      static const auto ml_dsa = provider_loads(scheme);
      return ml_dsa;
    }
    case schema::signature_scheme_t::ed25519: {
      static const auto ed25519 = provider_loads(scheme);
      return ed25519;
    }
  }
  return false;
}

schema::hash32_t make_key_id(const schema::public_key_t& public_key) {
  return blake3::hash(schema::make_bytes_view(public_key.key));
}

bool verify(const schema::hash32_t& digest,
            const schema::bytes_view_t& signature,
            const schema::public_key_t& public_key) {
  if (signature.empty() || public_key.key.empty()) {
    return false;
  }
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key_ex(nullptr, algorithm_name(public_key.scheme),
                                     nullptr, public_key.key.data(),
                                     public_key.key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit_ex(ctx.get(), nullptr, nullptr, nullptr, nullptr,
                              pkey.get(), nullptr) == 1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          digest.data(), digest.size()) == 1;
  }
  return ok;
}

bool verify_envelope(const schema::hash32_t& digest,
                     const schema::signature_envelope_t& envelope,
                     const key_ring_t& ring) {
  auto key = std::find_if(std::begin(ring), std::end(ring),
                          [&](const schema::public_key_t& candidate) {
                            return make_key_id(candidate) == envelope.key_id;
                          });
  if (key == std::end(ring)) {
    return false;
  }
  return verify(digest, schema::make_bytes_view(envelope.signature), *key);
}

signature_authority::signature_authority(
    std::string signer_id,
    const schema::signature_scheme_t scheme)
    : signer_id_{std::move(signer_id)},
      scheme_{scheme},
      key_{generate_key(scheme).release(), EVP_PKEY_free} {
  public_key_ = schema::public_key_t{.scheme = scheme_,
                                     .key = export_public_key(key_.get())};
  key_id_ = make_key_id(public_key_);
  if (scheme_ == schema::signature_scheme_t::ed25519) {
    spdlog::warn("signer '{}' uses ed25519, which is not quantum resistant",
                 signer_id_);
  }
  spdlog::info("signer '{}' generated {} key {}", signer_id_,
               schema::to_string(scheme_), schema::to_hex(key_id_));
}

signature_authority::~signature_authority() = default;

schema::bytes_t signature_authority::sign(
    const schema::hash32_t& digest) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit_ex(ctx.get(), nullptr, nullptr, nullptr,
                                    nullptr, key_.get(), nullptr) != 1) {
    throw common::error{common::error_code_t::crypto_failure,
                        "unable to initialize signing context"};
  }
  auto length = std::size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &length, digest.data(),
                     digest.size()) != 1) {
    throw common::error{common::error_code_t::crypto_failure,
                        "unable to size signature"};
  }
  auto signature = schema::bytes_t(length);
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, digest.data(),
                     digest.size()) != 1) {
    throw common::error{common::error_code_t::crypto_failure,
                        "signing failed"};
  }
  signature.resize(length);
  return signature;
}

schema::signature_envelope_t signature_authority::sign_envelope(
    const schema::hash32_t& digest) const {
  return schema::signature_envelope_t{.key_id = key_id_,
                                      .signature = sign(digest)};
}

}  // namespace warden::crypto
