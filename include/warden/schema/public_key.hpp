#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/signature_scheme.hpp>

namespace warden::schema {

/// Raw public key bytes as exported by the OpenSSL provider for `scheme`.
struct public_key_t final {
  signature_scheme_t scheme{signature_scheme_t::ml_dsa_65};
  bytes_t key;
};

/// Signature attached to a digest, naming the key that produced it.
struct signature_envelope_t final {
  hash32_t key_id{};
  bytes_t signature;
};

}  // namespace warden::schema
