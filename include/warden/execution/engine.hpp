#pragma once

#include <warden/audit/evidence_builder.hpp>
#include <warden/audit/log.hpp>
#include <warden/common/clock.hpp>
#include <warden/common/error.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/execution/approval_desk.hpp>
#include <warden/execution/gate.hpp>
#include <warden/execution/halt_switch.hpp>
#include <warden/ledger/store.hpp>
#include <warden/schema/account.hpp>
#include <warden/schema/approval_request.hpp>
#include <warden/schema/approval_token.hpp>
#include <warden/schema/audit_event.hpp>
#include <warden/schema/evidence_record.hpp>
#include <warden/schema/execution_mode.hpp>
#include <warden/schema/compliance_tier.hpp>
#include <warden/schema/transaction.hpp>
#include <warden/schema/transaction_status.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::execution {

struct engine_options final {
  /// Build an evidence record once this many events are uncovered; 0
  /// disables automatic evidence.
  uint64_t evidence_interval{0};
  std::string actor{"warden.engine"};
};

struct engine_statistics final {
  schema::execution_mode_t mode{schema::execution_mode_t::shadow};
  bool halted{false};
  uint64_t transactions{0};
  std::map<schema::transaction_status_t, uint64_t> by_status;
  uint64_t open_approvals{0};
  uint64_t evidence_records{0};
  audit::log_statistics audit;
};

/// Shadow execution engine. Every call that returns normally has witnessed
/// exactly one outcome event in the audit log first.
///
/// Lock order: gate (shared, for the unit of work) -> ledger accounts ->
/// audit log.
class engine final {
 public:
  /// Registers the authority's key with the log, installs it as the event
  /// signer and witnesses `engine_initialized`.
  engine(ledger::store& ledger,
         gate& mode_gate,
         audit::log& audit_log,
         audit::evidence_builder& evidence,
         const crypto::signature_authority& authority,
         approval_desk& approvals,
         halt_switch& halt,
         engine_options options = {},
         common::time_source_t now = common::system_time_source());

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Witnessed as `account_created`, the only way funds enter the ledger.
  schema::account_t create_account(const std::string& id,
                                   const schema::amount_t& initial_balance,
                                   const std::string& currency,
                                   const std::string& actor);

  /// Returns a witnessed transaction with a definite status. Throws
  /// `halted_by_operator`, `invalid_input` or `latency_cap_exceeded`.
  schema::transaction_t simulate_transaction(const std::string& from,
                                             const std::string& to,
                                             const schema::amount_t& amount,
                                             const std::string& currency,
                                             const std::string& actor);

  /// Refusals are witnessed as `compliance_violation` and rethrown.
  void promote(schema::execution_mode_t target,
               const std::optional<schema::approval_token_t>& token,
               const std::string& actor);

  /// Throws `halted_by_operator` while the emergency stop is asserted,
  /// leaving the request pending. A granted transfer whose outcome cannot
  /// be witnessed is recorded as rejected before the failure propagates.
  schema::transaction_t resolve_approval(const std::string& request_id,
                                         bool granted,
                                         const std::string& approver);

  /// Blocks for at most the remaining approval timeout, then converts an
  /// unresolved request to a rejection. Returns the recorded outcome at
  /// once for a request that is already closed.
  schema::transaction_t await_approval(const std::string& request_id);

  /// Rejects every request whose deadline has passed.
  std::vector<schema::transaction_t> expire_approvals();

  void emergency_stop(const std::string& actor, const std::string& reason);
  void clear_emergency_stop(const std::string& actor);
  bool halted() const { return halt_.halted(); }

  schema::evidence_record_t build_evidence_record(
      const schema::log_range_t& range,
      schema::compliance_tier_t tier = schema::compliance_tier_t::law_tier);
  bool verify_evidence_record(const schema::evidence_record_t& record) const;

  /// Digest links and signatures of the whole log.
  bool verify_chain() const;

  schema::execution_mode_t mode() const;
  schema::account_t account(const std::string& id) const;
  std::vector<schema::account_t> accounts() const;
  std::optional<schema::transaction_t> transaction(
      const std::string& transaction_id) const;
  schema::hash32_t chain_head() const;
  std::vector<schema::audit_event_t> latest_events(std::size_t count) const;
  std::optional<schema::evidence_record_t> latest_evidence_record() const;
  engine_statistics statistics() const;

 private:
  schema::transaction_t execute(schema::transaction_t tx,
                                const schema::decision_t& decision,
                                const std::string& actor);
  schema::transaction_t finalize(const schema::approval_request_t& request,
                                 const std::string& actor);
  void abandon(schema::transaction_t tx,
               const common::error& failure,
               const std::string& actor);
  schema::transaction_t reject(schema::transaction_t tx,
                               const std::string& reason,
                               schema::audit_event_kind_t kind,
                               const std::string& actor,
                               schema::payload_t extra = {});
  void record(const schema::transaction_t& tx);
  schema::transaction_t find_transaction(
      const std::string& transaction_id) const;
  /// Transaction of a request the desk no longer tracks. Throws
  /// `approval_not_found` for ids that were never opened.
  std::string closed_request_transaction(const std::string& request_id) const;
  void maybe_build_evidence();

  ledger::store& ledger_;
  gate& gate_;
  audit::log& log_;
  audit::evidence_builder& evidence_;
  const crypto::signature_authority& authority_;
  approval_desk& approvals_;
  halt_switch& halt_;
  engine_options options_;
  common::time_source_t now_;

  mutable std::mutex transactions_mutex_;
  std::map<std::string, schema::transaction_t> transactions_;
  // approval request id -> transaction id
  std::map<std::string, std::string> approval_index_;

  std::mutex evidence_mutex_;
  uint64_t evidence_covered_until_{0};
};

}  // namespace warden::execution
