#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/public_key.hpp>
#include <warden/schema/signature_scheme.hpp>

#include <memory>
#include <string>
#include <vector>

struct evp_pkey_st;

namespace warden::crypto {

using key_ring_t = std::vector<schema::public_key_t>;

/// True when the linked OpenSSL provider can generate keys for `scheme`.
bool available(schema::signature_scheme_t scheme);

/// BLAKE3 of the raw public key bytes.
schema::hash32_t make_key_id(const schema::public_key_t& public_key);

/// Pure predicate: false on any malformed key or signature, never throws.
bool verify(const schema::hash32_t& digest,
            const schema::bytes_view_t& signature,
            const schema::public_key_t& public_key);

/// Looks the envelope key up in `ring` and verifies against it.
bool verify_envelope(const schema::hash32_t& digest,
                     const schema::signature_envelope_t& envelope,
                     const key_ring_t& ring);

/// Holds one keypair for the lifetime of the process. The key is generated
/// in the constructor and never regenerated.
class signature_authority final {
 public:
  explicit signature_authority(
      std::string signer_id,
      schema::signature_scheme_t scheme = schema::signature_scheme_t::ml_dsa_65);
  ~signature_authority();

  signature_authority(const signature_authority&) = delete;
  signature_authority& operator=(const signature_authority&) = delete;
  signature_authority(signature_authority&&) = delete;
  signature_authority& operator=(signature_authority&&) = delete;

  const std::string& signer_id() const { return signer_id_; }
  schema::signature_scheme_t scheme() const { return scheme_; }
  const schema::public_key_t& public_key() const { return public_key_; }
  const schema::hash32_t& key_id() const { return key_id_; }

  /// Throws `error` with `crypto_failure` if the provider refuses to sign.
  schema::bytes_t sign(const schema::hash32_t& digest) const;
  schema::signature_envelope_t sign_envelope(
      const schema::hash32_t& digest) const;

 private:
  std::string signer_id_;
  schema::signature_scheme_t scheme_;
  std::unique_ptr<evp_pkey_st, void (*)(evp_pkey_st*)> key_;
  schema::public_key_t public_key_;
  schema::hash32_t key_id_{};
};

}  // namespace warden::crypto
