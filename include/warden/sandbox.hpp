#pragma once

#include <warden/audit/evidence_builder.hpp>
#include <warden/audit/log.hpp>
#include <warden/common/clock.hpp>
#include <warden/config/config.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/execution/approval_desk.hpp>
#include <warden/execution/engine.hpp>
#include <warden/execution/gate.hpp>
#include <warden/execution/halt_switch.hpp>
#include <warden/ledger/store.hpp>

#include <memory>
#include <optional>

namespace warden {

/// Owns one complete sandbox wired from a configuration: storage (when a
/// path is configured), audit log, signature authority, evidence builder,
/// ledger, gate, approval desk, halt switch and the engine over them.
class sandbox final {
 public:
  explicit sandbox(const config::sandbox_config& config,
                   common::time_source_t now = common::system_time_source());

  sandbox(const sandbox&) = delete;
  sandbox& operator=(const sandbox&) = delete;

  execution::engine& engine() { return *engine_; }
  const execution::engine& engine() const { return *engine_; }
  audit::log& audit_log() { return *log_; }
  const audit::log& audit_log() const { return *log_; }
  audit::evidence_builder& evidence() { return *evidence_; }
  const crypto::signature_authority& authority() const { return *authority_; }
  ledger::store& ledger() { return ledger_; }
  execution::gate& gate() { return *gate_; }
  execution::approval_desk& approvals() { return *approvals_; }
  execution::halt_switch& halt() { return halt_; }
  audit::storage_t* storage() { return storage_ ? &*storage_ : nullptr; }

 private:
  std::optional<audit::storage_t> storage_;
  std::unique_ptr<audit::log> log_;
  std::unique_ptr<crypto::signature_authority> authority_;
  std::unique_ptr<audit::evidence_builder> evidence_;
  ledger::store ledger_;
  std::unique_ptr<execution::gate> gate_;
  std::unique_ptr<execution::approval_desk> approvals_;
  execution::halt_switch halt_;
  std::unique_ptr<execution::engine> engine_;
};

}  // namespace warden
