#pragma once

#include <cstddef>
#include <string>

namespace warden::common {

/// Hex encoding of `byte_count` bytes drawn from OpenSSL's CSPRNG.
/// Throws `error` with `crypto_failure` when the generator is not seeded.
std::string random_hex(std::size_t byte_count);

}  // namespace warden::common
