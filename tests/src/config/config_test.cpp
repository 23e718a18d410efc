#include <warden/blake3/hash.hpp>
#include <warden/common/error.hpp>
#include <warden/config/config.hpp>
#include <warden/testing/common.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

warden::config::sandbox_config parse(const std::string& text) {
  auto input = std::istringstream{text};
  return warden::config::parse_config(input);
}

std::string rejection(const std::string& text) {
  try {
    parse(text);
  } catch (const warden::common::error& e) {
    EXPECT_EQ(e.code(), warden::common::error_code_t::invalid_input);
    return e.what();
  }
  ADD_FAILURE() << "configuration accepted: " << text;
  return {};
}

}  // namespace

TEST(config, defaults) {
  auto config = parse("");
  EXPECT_EQ(config.genesis_digest,
            warden::blake3::hash(std::string_view{"warden-audit-genesis-v1"}));
  EXPECT_EQ(config.genesis_digest, warden::config::default_genesis_digest());
  EXPECT_EQ(config.signer_id, "warden-audit");
  EXPECT_EQ(config.signature_scheme,
            warden::schema::signature_scheme_t::ml_dsa_65);
  EXPECT_EQ(config.soft_target.count(), 50);
  EXPECT_EQ(config.hard_cap.count(), 500);
  EXPECT_EQ(config.pilot_auto_commit_limit, 0);
  EXPECT_EQ(config.production_auto_commit_limit,
            warden::testing::amount("10000.00"));
  EXPECT_EQ(config.approval_timeout.count(), 30000);
  EXPECT_EQ(config.evidence_interval, 0u);
  EXPECT_FALSE(config.storage_path.has_value());
  EXPECT_TRUE(config.trusted_approvers.empty());
  EXPECT_EQ(config.log_level, "info");
}

TEST(config, sections_map_to_keys) {
  auto genesis = std::string(64, 'a');
  auto config = parse(
      "[audit]\n"
      "genesis = " + genesis + "\n"
      "signer_id = auditor-7\n"
      "signature_scheme = ed25519\n"
      "soft_target_ms = 20\n"
      "hard_cap_ms = 250\n"
      "[gate]\n"
      "pilot_auto_commit_limit = 250.50\n"
      "production_auto_commit_limit = 5000\n"
      "trusted_approver = alice:0a0b0c\n"
      "trusted_approver = bob:ff\n"
      "[approval]\n"
      "timeout_ms = 1500\n"
      "[evidence]\n"
      "interval = 64\n"
      "[storage]\n"
      "path = /var/lib/warden\n"
      "[log]\n"
      "level = debug\n");

  EXPECT_EQ(warden::schema::to_hex(config.genesis_digest), genesis);
  EXPECT_EQ(config.signer_id, "auditor-7");
  EXPECT_EQ(config.signature_scheme, warden::schema::signature_scheme_t::ed25519);
  EXPECT_EQ(config.soft_target.count(), 20);
  EXPECT_EQ(config.hard_cap.count(), 250);
  EXPECT_EQ(config.pilot_auto_commit_limit, 25050);
  EXPECT_EQ(config.production_auto_commit_limit, 500000);
  ASSERT_EQ(config.trusted_approvers.size(), 2u);
  EXPECT_EQ(config.trusted_approvers[0].approver_id, "alice");
  EXPECT_EQ(config.trusted_approvers[0].public_key.key,
            (warden::schema::bytes_t{0x0a, 0x0b, 0x0c}));
  EXPECT_EQ(config.trusted_approvers[0].public_key.scheme,
            warden::schema::signature_scheme_t::ed25519);
  EXPECT_EQ(config.trusted_approvers[1].approver_id, "bob");
  EXPECT_EQ(config.approval_timeout.count(), 1500);
  EXPECT_EQ(config.evidence_interval, 64u);
  EXPECT_EQ(config.storage_path, "/var/lib/warden");
  EXPECT_EQ(config.log_level, "debug");
}

TEST(config, approvers_may_name_their_own_scheme) {
  auto config = parse(
      "[audit]\n"
      "signature_scheme = ml-dsa-65\n"
      "[gate]\n"
      "trusted_approver = alice:0a0b0c\n"
      "trusted_approver = bob:ed25519:ff01\n"
      "trusted_approver = carol:ml-dsa-65:ee\n");

  ASSERT_EQ(config.trusted_approvers.size(), 3u);
  EXPECT_EQ(config.trusted_approvers[0].public_key.scheme,
            warden::schema::signature_scheme_t::ml_dsa_65);
  EXPECT_EQ(config.trusted_approvers[1].approver_id, "bob");
  EXPECT_EQ(config.trusted_approvers[1].public_key.scheme,
            warden::schema::signature_scheme_t::ed25519);
  EXPECT_EQ(config.trusted_approvers[1].public_key.key,
            (warden::schema::bytes_t{0xff, 0x01}));
  EXPECT_EQ(config.trusted_approvers[2].approver_id, "carol");
  EXPECT_EQ(config.trusted_approvers[2].public_key.scheme,
            warden::schema::signature_scheme_t::ml_dsa_65);
}

TEST(config, invalid_values_name_their_key) {
  EXPECT_NE(rejection("[audit]\nhard_cap_ms = soon\n").find("audit.hard_cap_ms"),
            std::string::npos);
  EXPECT_NE(rejection("[audit]\nhard_cap_ms = 0\n").find("audit.hard_cap_ms"),
            std::string::npos);
  EXPECT_NE(rejection("[audit]\nsoft_target_ms = 600\n")
                .find("audit.soft_target_ms"),
            std::string::npos);
  EXPECT_NE(rejection("[audit]\ngenesis = 1234\n").find("audit.genesis"),
            std::string::npos);
  EXPECT_NE(rejection("[audit]\nsignature_scheme = rsa\n")
                .find("audit.signature_scheme"),
            std::string::npos);
  EXPECT_NE(rejection("[gate]\npilot_auto_commit_limit = -1.00\n")
                .find("gate.pilot_auto_commit_limit"),
            std::string::npos);
  EXPECT_NE(rejection("[gate]\nproduction_auto_commit_limit = 1.234\n")
                .find("gate.production_auto_commit_limit"),
            std::string::npos);
  EXPECT_NE(rejection("[gate]\ntrusted_approver = no-key\n")
                .find("gate.trusted_approver"),
            std::string::npos);
  EXPECT_NE(rejection("[gate]\ntrusted_approver = carol:zz\n")
                .find("gate.trusted_approver"),
            std::string::npos);
  EXPECT_NE(rejection("[gate]\ntrusted_approver = dave:rsa:0a0b\n")
                .find("gate.trusted_approver"),
            std::string::npos);
  EXPECT_NE(rejection("[gate]\ntrusted_approver = erin:ed25519:\n")
                .find("gate.trusted_approver"),
            std::string::npos);
  EXPECT_NE(rejection("[log]\nlevel = loud\n").find("log.level"),
            std::string::npos);
  rejection("[evidence]\ninterval = -3\n");
  rejection("[audit]\nunknown_key = 1\n");
}

TEST(config, missing_file_is_invalid_input) {
  try {
    warden::config::load_config("/nonexistent/warden.cfg");
    ADD_FAILURE() << "missing file accepted";
  } catch (const warden::common::error& e) {
    EXPECT_EQ(e.code(), warden::common::error_code_t::invalid_input);
  }
}
