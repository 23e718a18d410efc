#include <warden/common/error.hpp>

#include <spdlog/fmt/fmt.h>

namespace warden::common {

error::error(const error_code_t code, const std::string& message)
    : std::runtime_error{fmt::format("{}: {}", to_string(code), message)},
      code_{code} {}

chain_integrity_violation::chain_integrity_violation(const uint64_t sequence,
                                                     const std::string& reason)
    : error{error_code_t::chain_integrity_violation,
            fmt::format("entry {}: {}", sequence, reason)},
      sequence_{sequence} {}

}  // namespace warden::common
