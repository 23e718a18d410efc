#pragma once

#include <warden/execution/gate.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/signature_scheme.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

/// Genesis link used when `audit.genesis` is not configured: BLAKE3 of
/// "warden-audit-genesis-v1".
schema::hash32_t default_genesis_digest();

struct sandbox_config final {
  schema::hash32_t genesis_digest{default_genesis_digest()};
  std::string signer_id{"warden-audit"};
  schema::signature_scheme_t signature_scheme{
      schema::signature_scheme_t::ml_dsa_65};
  std::chrono::milliseconds soft_target{50};
  std::chrono::milliseconds hard_cap{500};
  schema::amount_t pilot_auto_commit_limit{0};
  schema::amount_t production_auto_commit_limit{1000000};
  std::vector<execution::trusted_approver_t> trusted_approvers;
  std::chrono::milliseconds approval_timeout{30000};
  uint64_t evidence_interval{0};
  std::optional<std::string> storage_path;
  std::string log_level{"info"};
};

/// Every configuration key, usable both for config files and the command
/// line (`--audit.hard_cap_ms 250`).
boost::program_options::options_description make_options();

/// Throws `error` with `invalid_input` naming the offending key.
sandbox_config from_variables(const boost::program_options::variables_map& vm);

sandbox_config parse_config(std::istream& input);
sandbox_config load_config(const std::string& path);

}  // namespace warden::config
