#include <warden/sandbox.hpp>

#include <spdlog/spdlog.h>

namespace warden {

sandbox::sandbox(const config::sandbox_config& config,
                 common::time_source_t now) {
  if (config.storage_path) {
    storage_.emplace(
        storage::make_storage<storage::rocksdb_storage_tag>(*config.storage_path));
  }
  log_ = std::make_unique<audit::log>(
      audit::log_options{.genesis_digest = config.genesis_digest,
                         .soft_target = config.soft_target,
                         .hard_cap = config.hard_cap},
      storage(), now);
  authority_ = std::make_unique<crypto::signature_authority>(
      config.signer_id, config.signature_scheme);
  evidence_ = std::make_unique<audit::evidence_builder>(*log_, *authority_,
                                                        storage(), now);
  gate_ = std::make_unique<execution::gate>(execution::gate_options{
      .pilot_auto_commit_limit = config.pilot_auto_commit_limit,
      .production_auto_commit_limit = config.production_auto_commit_limit,
      .trusted_approvers = config.trusted_approvers});
  if (config.trusted_approvers.empty()) {
    spdlog::warn("sandbox: no trusted approver configured, promotion is "
                 "disabled");
  }
  approvals_ = std::make_unique<execution::approval_desk>(
      config.approval_timeout, now);
  engine_ = std::make_unique<execution::engine>(
      ledger_, *gate_, *log_, *evidence_, *authority_, *approvals_, halt_,
      execution::engine_options{.evidence_interval = config.evidence_interval},
      now);
}

}  // namespace warden
