#include <warden/common/error.hpp>
#include <warden/common/random.hpp>
#include <warden/schema/primitives.hpp>

#include <openssl/rand.h>

namespace warden::common {

std::string random_hex(const std::size_t byte_count) {
  auto bytes = schema::bytes_t(byte_count);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw error{error_code_t::crypto_failure,
                "random generator failed to produce identifier bytes"};
  }
  return schema::to_hex(bytes);
}

}  // namespace warden::common
