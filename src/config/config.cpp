#include <warden/blake3/hash.hpp>
#include <warden/common/error.hpp>
#include <warden/config/config.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <istream>

namespace warden::config {

namespace po = boost::program_options;

namespace {

[[noreturn]] void invalid(const std::string_view key,
                          const std::string_view value,
                          const std::string_view expected) {
  throw common::error{
      common::error_code_t::invalid_input,
      fmt::format("{} = '{}' is invalid, expected {}", key, value, expected)};
}

uint64_t parse_unsigned(const std::string_view key,
                        const std::string& value) {
  auto parsed = uint64_t{};
  auto [end, status] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (status != std::errc{} || end != value.data() + value.size() ||
      value.empty()) {
    invalid(key, value, "an unsigned integer");
  }
  return parsed;
}

std::chrono::milliseconds parse_milliseconds(const std::string_view key,
                                             const std::string& value) {
  auto parsed = parse_unsigned(key, value);
  if (parsed == 0) {
    invalid(key, value, "a positive number of milliseconds");
  }
  return std::chrono::milliseconds{parsed};
}

schema::amount_t parse_limit(const std::string_view key,
                             const std::string& value) {
  auto parsed = schema::parse_amount(value);
  if (!parsed || *parsed < 0) {
    invalid(key, value, "a non-negative decimal amount");
  }
  return *parsed;
}

execution::trusted_approver_t parse_approver(
    const std::string& value,
    const schema::signature_scheme_t default_scheme) {
  constexpr auto expected =
      std::string_view{"id:hex-public-key or id:scheme:hex-public-key"};
  auto separator = value.find(':');
  if (separator == std::string::npos || separator == 0) {
    invalid("gate.trusted_approver", value, expected);
  }
  auto scheme = default_scheme;
  auto key_start = separator + 1;
  if (auto next = value.find(':', key_start); next != std::string::npos) {
    auto named = schema::try_from_string<schema::signature_scheme_t>(
        std::string_view{value}.substr(key_start, next - key_start));
    if (!named) {
      invalid("gate.trusted_approver", value, expected);
    }
    scheme = *named;
    key_start = next + 1;
  }
  auto key = schema::try_from_hex(std::string_view{value}.substr(key_start));
  if (!key || key->empty()) {
    invalid("gate.trusted_approver", value, expected);
  }
  return execution::trusted_approver_t{
      .approver_id = value.substr(0, separator),
      .public_key = schema::public_key_t{.scheme = scheme,
                                         .key = std::move(*key)}};
}

}  // namespace

schema::hash32_t default_genesis_digest() {
  return blake3::hash(std::string_view{"warden-audit-genesis-v1"});
}

po::options_description make_options() {
  auto description = po::options_description{"Sandbox configuration"};
  description.add_options()(
      "audit.genesis", po::value<std::string>(),
      "Hex genesis digest linked by the first audit event")(
      "audit.signer_id", po::value<std::string>(),
      "Identity of the audit signature authority")(
      "audit.signature_scheme", po::value<std::string>(),
      "ml-dsa-65 (default) or ed25519")(
      "audit.soft_target_ms", po::value<std::string>(),
      "Witness latency that logs a warning")(
      "audit.hard_cap_ms", po::value<std::string>(),
      "Witness latency that fails the operation")(
      "gate.pilot_auto_commit_limit", po::value<std::string>(),
      "Largest amount committed without approval in PILOT")(
      "gate.production_auto_commit_limit", po::value<std::string>(),
      "Largest amount committed without approval in PRODUCTION")(
      "gate.trusted_approver", po::value<std::vector<std::string>>()->composing(),
      "Promotion approver as id:[scheme:]hex-public-key (repeatable); the "
      "scheme defaults to audit.signature_scheme")(
      "approval.timeout_ms", po::value<std::string>(),
      "Time an approval request waits before it is rejected")(
      "evidence.interval", po::value<std::string>(),
      "Events per automatic evidence record (0 disables)")(
      "storage.path", po::value<std::string>(),
      "RocksDB directory for the audit chain")(
      "log.level", po::value<std::string>(),
      "trace, debug, info, warn, error or critical");
  return description;
}

sandbox_config from_variables(const po::variables_map& vm) {
  auto config = sandbox_config{};

  if (vm.contains("audit.genesis")) {
    const auto& value = vm["audit.genesis"].as<std::string>();
    auto genesis = schema::try_make_hash32(value);
    if (!genesis) {
      invalid("audit.genesis", value, "64 hex characters");
    }
    config.genesis_digest = *genesis;
  }
  if (vm.contains("audit.signer_id")) {
    config.signer_id = vm["audit.signer_id"].as<std::string>();
    if (config.signer_id.empty()) {
      invalid("audit.signer_id", config.signer_id, "a non-empty identity");
    }
  }
  if (vm.contains("audit.signature_scheme")) {
    const auto& value = vm["audit.signature_scheme"].as<std::string>();
    auto scheme = schema::try_from_string<schema::signature_scheme_t>(value);
    if (!scheme) {
      invalid("audit.signature_scheme", value, "ml-dsa-65 or ed25519");
    }
    config.signature_scheme = *scheme;
  }
  if (vm.contains("audit.soft_target_ms")) {
    config.soft_target = parse_milliseconds(
        "audit.soft_target_ms", vm["audit.soft_target_ms"].as<std::string>());
  }
  if (vm.contains("audit.hard_cap_ms")) {
    config.hard_cap = parse_milliseconds(
        "audit.hard_cap_ms", vm["audit.hard_cap_ms"].as<std::string>());
  }
  if (config.soft_target > config.hard_cap) {
    invalid("audit.soft_target_ms", std::to_string(config.soft_target.count()),
            "a value not above audit.hard_cap_ms");
  }
  if (vm.contains("gate.pilot_auto_commit_limit")) {
    config.pilot_auto_commit_limit =
        parse_limit("gate.pilot_auto_commit_limit",
                    vm["gate.pilot_auto_commit_limit"].as<std::string>());
  }
  if (vm.contains("gate.production_auto_commit_limit")) {
    config.production_auto_commit_limit =
        parse_limit("gate.production_auto_commit_limit",
                    vm["gate.production_auto_commit_limit"].as<std::string>());
  }
  if (vm.contains("gate.trusted_approver")) {
    for (const auto& value :
         vm["gate.trusted_approver"].as<std::vector<std::string>>()) {
      config.trusted_approvers.push_back(
          parse_approver(value, config.signature_scheme));
    }
  }
  if (vm.contains("approval.timeout_ms")) {
    config.approval_timeout = parse_milliseconds(
        "approval.timeout_ms", vm["approval.timeout_ms"].as<std::string>());
  }
  if (vm.contains("evidence.interval")) {
    config.evidence_interval = parse_unsigned(
        "evidence.interval", vm["evidence.interval"].as<std::string>());
  }
  if (vm.contains("storage.path")) {
    config.storage_path = vm["storage.path"].as<std::string>();
  }
  if (vm.contains("log.level")) {
    const auto& value = vm["log.level"].as<std::string>();
    if (spdlog::level::from_str(value) == spdlog::level::off &&
        value != "off") {
      invalid("log.level", value, "a spdlog level name");
    }
    config.log_level = value;
  }
  return config;
}

sandbox_config parse_config(std::istream& input) {
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, make_options()), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw common::error{common::error_code_t::invalid_input, e.what()};
  }
  return from_variables(vm);
}

sandbox_config load_config(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    throw common::error{common::error_code_t::invalid_input,
                        fmt::format("cannot read configuration file {}", path)};
  }
  spdlog::info("config: loading {}", path);
  return parse_config(input);
}

}  // namespace warden::config
