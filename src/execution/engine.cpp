#include <warden/common/critical.hpp>
#include <warden/common/error.hpp>
#include <warden/execution/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <variant>

namespace warden::execution {

namespace {

// Releases await_approval callers once a claimed request has been
// finalized, whether or not finalization succeeded.
class completion_guard final {
 public:
  completion_guard(approval_desk& desk, std::string request_id)
      : desk_{desk}, request_id_{std::move(request_id)} {}
  ~completion_guard() { desk_.complete(request_id_); }

  completion_guard(const completion_guard&) = delete;
  completion_guard& operator=(const completion_guard&) = delete;

 private:
  approval_desk& desk_;
  std::string request_id_;
};

std::optional<std::string> validate_intent(
    const schema::transaction_intent_t& intent) {
  if (intent.from.empty() || intent.to.empty()) {
    return "source and destination accounts must not be empty";
  }
  if (intent.from == intent.to) {
    return fmt::format("transfer from '{}' to itself", intent.from);
  }
  if (intent.currency.empty()) {
    return "currency must not be empty";
  }
  if (intent.amount <= 0) {
    return fmt::format("amount {} must be positive",
                       schema::format_amount(intent.amount));
  }
  return std::nullopt;
}

[[noreturn]] void already_resolved(const std::string& request_id) {
  throw common::error{
      common::error_code_t::approval_already_resolved,
      fmt::format("approval request '{}' is already closed", request_id)};
}

void append(schema::payload_t& payload, schema::payload_t extra) {
  payload.insert(std::end(payload), std::make_move_iterator(std::begin(extra)),
                 std::make_move_iterator(std::end(extra)));
}

}  // namespace

engine::engine(ledger::store& ledger,
               gate& mode_gate,
               audit::log& audit_log,
               audit::evidence_builder& evidence,
               const crypto::signature_authority& authority,
               approval_desk& approvals,
               halt_switch& halt,
               engine_options options,
               common::time_source_t now)
    : ledger_{ledger},
      gate_{mode_gate},
      log_{audit_log},
      evidence_{evidence},
      authority_{authority},
      approvals_{approvals},
      halt_{halt},
      options_{std::move(options)},
      now_{std::move(now)} {
  log_.register_key(authority_.public_key());
  log_.set_signer([&signer = authority_](const schema::hash32_t& digest) {
    return signer.sign_envelope(digest);
  });
  if (auto latest = evidence_.latest()) {
    evidence_covered_until_ = latest->range.last + 1;
  }
  auto resumed = log_.size();
  log_.witness(
      schema::audit_event_kind_t::engine_initialized, options_.actor,
      schema::payload_t{
          {"mode", std::string{schema::to_string(gate_.mode())}},
          {"signer_id", authority_.signer_id()},
          {"scheme", std::string{schema::to_string(authority_.scheme())}},
          {"key_id", schema::to_hex(authority_.key_id())},
          {"genesis", schema::to_hex(log_.genesis())},
          {"resumed_events", std::to_string(resumed)},
      },
      schema::compliance_tier_t::informational_tier);
  spdlog::info("engine: initialized in {} mode over {} existing events",
               schema::to_string(gate_.mode()), resumed);
}

schema::account_t engine::create_account(
    const std::string& id,
    const schema::amount_t& initial_balance,
    const std::string& currency,
    const std::string& actor) {
  auto account = ledger_.create_account(
      id, initial_balance, currency, [&](const schema::account_t& created) {
        log_.witness(schema::audit_event_kind_t::account_created, actor,
                     schema::payload_t{
                         {"account_id", created.id()},
                         {"initial_balance",
                          schema::format_amount(created.balance())},
                         {"currency", created.currency()},
                     },
                     schema::compliance_tier_t::informational_tier);
      });
  maybe_build_evidence();
  return account;
}

schema::transaction_t engine::simulate_transaction(
    const std::string& from,
    const std::string& to,
    const schema::amount_t& amount,
    const std::string& currency,
    const std::string& actor) {
  if (halt_.halted()) {
    spdlog::warn("engine: refused transfer '{}' -> '{}' while halted", from,
                 to);
    throw common::error{common::error_code_t::halted_by_operator,
                        "emergency stop is asserted"};
  }

  auto intent = schema::transaction_intent_t{
      .from = from, .to = to, .amount = amount, .currency = currency};
  if (auto problem = validate_intent(intent)) {
    log_.witness(schema::audit_event_kind_t::invalid_input, actor,
                 schema::payload_t{
                     {"from", from},
                     {"to", to},
                     {"amount", schema::format_amount(amount)},
                     {"currency", currency},
                     {"reason", *problem},
                 },
                 schema::compliance_tier_t::advisory_tier);
    throw common::error{common::error_code_t::invalid_input, *problem};
  }

  auto tx = schema::transaction_t{};
  {
    auto authorization = gate_.authorize(intent);
    if (halt_.halted()) {
      throw common::error{common::error_code_t::halted_by_operator,
                          "emergency stop is asserted"};
    }
    tx = execute(schema::make_transaction(intent, authorization.mode, now_()),
                 authorization.decision, actor);
  }
  maybe_build_evidence();
  return tx;
}

schema::transaction_t engine::execute(schema::transaction_t tx,
                                      const schema::decision_t& decision,
                                      const std::string& actor) {
  auto witness_outcome = [&](const schema::audit_event_kind_t kind,
                             const schema::compliance_tier_t tier,
                             schema::payload_t extra) {
    auto payload = schema::make_transaction_payload(tx);
    append(payload, std::move(extra));
    auto event = log_.witness(kind, actor, std::move(payload), tier);
    tx.witnessed = true;
    tx.audit_sequence = event.sequence;
  };

  try {
    std::visit(
        schema::overloaded{
            [&](const schema::simulate_t&) {
              ledger_.project_transfer(
                  tx, [&](const ledger::transfer_projection_t& projection) {
                    tx.projection = schema::balance_projection_t{
                        .from_balance = projection.from.balance(),
                        .to_balance = projection.to.balance()};
                    schema::transition(tx,
                                       schema::transaction_status_t::simulated);
                    witness_outcome(
                        schema::audit_event_kind_t::transaction_simulation,
                        schema::compliance_tier_t::informational_tier, {});
                  });
            },
            [&](const schema::commit_t&) {
              ledger_.apply_transfer(
                  tx, [&](const ledger::transfer_projection_t& projection) {
                    tx.projection = schema::balance_projection_t{
                        .from_balance = projection.from.balance(),
                        .to_balance = projection.to.balance()};
                    schema::transition(tx,
                                       schema::transaction_status_t::executed);
                    witness_outcome(
                        schema::audit_event_kind_t::transaction_committed,
                        schema::compliance_tier_t::policy_tier, {});
                  });
            },
            [&](const schema::require_approval_t& required) {
              // Existence and currency are checked now; funds are checked
              // again when the approval is granted.
              auto projection = ledger_.project_transfer(tx);
              tx.projection = schema::balance_projection_t{
                  .from_balance = projection.from.balance(),
                  .to_balance = projection.to.balance()};
              auto request = approvals_.open(tx.transaction_id, actor);
              tx.approval_request_id = request.request_id;
              schema::transition(
                  tx, schema::transaction_status_t::approval_required);
              try {
                witness_outcome(
                    schema::audit_event_kind_t::approval_requested,
                    schema::compliance_tier_t::policy_tier,
                    schema::payload_t{
                        {"approval_reason", required.reason},
                        {"auto_commit_limit",
                         schema::format_amount(required.limit)},
                        {"deadline", std::to_string(request.deadline)},
                    });
              } catch (...) {
                approvals_.discard(request.request_id);
                throw;
              }
            }},
        decision);
  } catch (const common::error& e) {
    if (!common::is_business_rejection(e.code())) {
      throw;
    }
    return reject(std::move(tx), std::string{common::to_string(e.code())},
                  schema::audit_event_kind_t::transaction_rejected, actor,
                  schema::payload_t{{"detail", e.what()}});
  }

  record(tx);
  spdlog::info("engine: {} {} {} {} '{}' -> '{}' in {}", tx.transaction_id,
               schema::to_string(tx.status), schema::format_amount(tx.amount),
               tx.currency, tx.from, tx.to, schema::to_string(tx.mode));
  return tx;
}

schema::transaction_t engine::reject(schema::transaction_t tx,
                                     const std::string& reason,
                                     const schema::audit_event_kind_t kind,
                                     const std::string& actor,
                                     schema::payload_t extra) {
  tx.rejection_reason = reason;
  schema::transition(tx, schema::transaction_status_t::rejected);
  auto payload = schema::make_transaction_payload(tx);
  append(payload, std::move(extra));
  auto event = log_.witness(kind, actor, std::move(payload),
                            schema::compliance_tier_t::advisory_tier);
  tx.witnessed = true;
  tx.audit_sequence = event.sequence;
  record(tx);
  spdlog::info("engine: {} rejected ({})", tx.transaction_id, reason);
  return tx;
}

// A claimed request whose outcome could not be witnessed must still end
// terminal, so the rejection is recorded even when the log refuses it too.
void engine::abandon(schema::transaction_t tx,
                     const common::error& failure,
                     const std::string& actor) {
  tx.rejection_reason = std::string{common::to_string(failure.code())};
  tx.witnessed = false;
  tx.audit_sequence.reset();
  schema::transition(tx, schema::transaction_status_t::rejected);
  auto payload = schema::make_transaction_payload(tx);
  append(payload, schema::payload_t{{"detail", failure.what()}});
  try {
    auto event = log_.witness(schema::audit_event_kind_t::transaction_rejected,
                              actor, std::move(payload),
                              schema::compliance_tier_t::advisory_tier);
    tx.witnessed = true;
    tx.audit_sequence = event.sequence;
  } catch (const common::error& e) {
    spdlog::error("engine: rejection of {} could not be witnessed: {}",
                  tx.transaction_id, e.what());
  }
  record(tx);
  spdlog::error("engine: {} rejected after a failed settlement: {}",
                tx.transaction_id, failure.what());
}

void engine::record(const schema::transaction_t& tx) {
  auto lock = std::scoped_lock{transactions_mutex_};
  if (tx.approval_request_id) {
    approval_index_.insert_or_assign(*tx.approval_request_id,
                                     tx.transaction_id);
  }
  transactions_.insert_or_assign(tx.transaction_id, tx);
}

std::string engine::closed_request_transaction(
    const std::string& request_id) const {
  auto lock = std::scoped_lock{transactions_mutex_};
  auto found = approval_index_.find(request_id);
  if (found == std::end(approval_index_)) {
    throw common::error{
        common::error_code_t::approval_not_found,
        fmt::format("approval request '{}' does not exist", request_id)};
  }
  return found->second;
}

schema::transaction_t engine::find_transaction(
    const std::string& transaction_id) const {
  auto lock = std::scoped_lock{transactions_mutex_};
  auto found = transactions_.find(transaction_id);
  if (found == std::end(transactions_)) {
    throw common::error{
        common::error_code_t::approval_not_found,
        fmt::format("transaction '{}' is not registered", transaction_id)};
  }
  return found->second;
}

schema::transaction_t engine::finalize(
    const schema::approval_request_t& request,
    const std::string& actor) {
  auto guard = completion_guard{approvals_, request.request_id};
  auto tx = find_transaction(request.transaction_id);
  auto approval_fields = schema::payload_t{
      {"approval_request_id", request.request_id},
      {"approver", request.resolved_by.value_or(actor)},
  };

  switch (request.state) {
    case schema::approval_state_t::granted: {
      const auto pending = tx;
      try {
        log_.witness(schema::audit_event_kind_t::approval_granted, actor,
                     schema::payload_t{
                         {"transaction_id", tx.transaction_id},
                         {"approval_request_id", request.request_id},
                         {"approver", request.resolved_by.value_or(actor)},
                     },
                     schema::compliance_tier_t::policy_tier);
        ledger_.apply_transfer(
            tx, [&](const ledger::transfer_projection_t& projection) {
              tx.projection = schema::balance_projection_t{
                  .from_balance = projection.from.balance(),
                  .to_balance = projection.to.balance()};
              schema::transition(tx, schema::transaction_status_t::executed);
              auto payload = schema::make_transaction_payload(tx);
              append(payload, approval_fields);
              auto event =
                  log_.witness(schema::audit_event_kind_t::transaction_committed,
                               actor, std::move(payload),
                               schema::compliance_tier_t::policy_tier);
              tx.audit_sequence = event.sequence;
            });
      } catch (const common::error& e) {
        if (!common::is_business_rejection(e.code())) {
          abandon(pending, e, actor);
          throw;
        }
        return reject(std::move(tx), std::string{common::to_string(e.code())},
                      schema::audit_event_kind_t::transaction_rejected, actor,
                      schema::payload_t{{"detail", e.what()}});
      }
      record(tx);
      spdlog::info("engine: {} executed on approval {}", tx.transaction_id,
                   request.request_id);
      return tx;
    }
    case schema::approval_state_t::denied:
      return reject(std::move(tx), "approval_denied",
                    schema::audit_event_kind_t::approval_denied, actor,
                    approval_fields);
    case schema::approval_state_t::expired:
      return reject(std::move(tx), "approval_expired",
                    schema::audit_event_kind_t::approval_expired, actor,
                    approval_fields);
    case schema::approval_state_t::pending:
      break;
  }
  common::critical("engine: approval {} finalized while still pending",
                   request.request_id);
}

schema::transaction_t engine::resolve_approval(const std::string& request_id,
                                               const bool granted,
                                               const std::string& approver) {
  auto request = approvals_.find(request_id);
  if (!request) {
    closed_request_transaction(request_id);
    already_resolved(request_id);
  }
  // The transaction must be registered before its request can be claimed.
  find_transaction(request->transaction_id);
  if (halt_.halted()) {
    spdlog::warn("engine: refused to resolve approval {} while halted",
                 request_id);
    throw common::error{common::error_code_t::halted_by_operator,
                        "emergency stop is asserted"};
  }
  auto claimed = schema::approval_request_t{};
  try {
    claimed = approvals_.claim(request_id, granted, approver);
  } catch (const common::error& e) {
    if (e.code() != common::error_code_t::approval_not_found) {
      throw;
    }
    // Finalized and forgotten since the lookup above.
    already_resolved(request_id);
  }
  auto tx = finalize(claimed, approver);
  maybe_build_evidence();
  return tx;
}

schema::transaction_t engine::await_approval(const std::string& request_id) {
  auto request = approvals_.find(request_id);
  if (!request) {
    return find_transaction(closed_request_transaction(request_id));
  }
  if (!approvals_.wait(request_id, approvals_.remaining(request_id))) {
    if (auto expired = approvals_.expire(request_id)) {
      spdlog::warn("engine: approval {} timed out", request_id);
      auto tx = finalize(*expired, options_.actor);
      maybe_build_evidence();
      return tx;
    }
    // Claimed by a resolver that is still finalizing.
    if (!approvals_.wait(request_id, log_.options().hard_cap * 2)) {
      spdlog::warn("engine: approval {} is still being finalized",
                   request_id);
    }
  }
  return find_transaction(request->transaction_id);
}

std::vector<schema::transaction_t> engine::expire_approvals() {
  auto expired = std::vector<schema::transaction_t>{};
  for (const auto& request_id : approvals_.overdue()) {
    if (auto request = approvals_.expire(request_id)) {
      expired.push_back(finalize(*request, options_.actor));
    }
  }
  if (!expired.empty()) {
    spdlog::warn("engine: expired {} overdue approvals", expired.size());
    maybe_build_evidence();
  }
  return expired;
}

void engine::promote(const schema::execution_mode_t target,
                     const std::optional<schema::approval_token_t>& token,
                     const std::string& actor) {
  auto from = gate_.mode();
  try {
    gate_.promote(
        target, token,
        [&](const schema::execution_mode_t previous,
            const schema::execution_mode_t next,
            const schema::approval_token_t& approval) {
          log_.witness(schema::audit_event_kind_t::mode_transition, actor,
                       schema::payload_t{
                           {"from", std::string{schema::to_string(previous)}},
                           {"to", std::string{schema::to_string(next)}},
                           {"approver", approval.approver_id},
                           {"issued_at", std::to_string(approval.issued_at)},
                       },
                       schema::compliance_tier_t::law_tier);
        });
  } catch (const common::error& e) {
    if (e.code() != common::error_code_t::unauthorized_promotion) {
      throw;
    }
    log_.witness(schema::audit_event_kind_t::compliance_violation, actor,
                 schema::payload_t{
                     {"violation", "unauthorized_promotion"},
                     {"from", std::string{schema::to_string(from)}},
                     {"target", std::string{schema::to_string(target)}},
                     {"detail", e.what()},
                 },
                 schema::compliance_tier_t::law_tier);
    throw;
  }
  maybe_build_evidence();
}

void engine::emergency_stop(const std::string& actor,
                            const std::string& reason) {
  halt_.assert_halt();
  spdlog::warn("engine: emergency stop asserted by '{}': {}", actor, reason);
  log_.witness(schema::audit_event_kind_t::emergency_stop_triggered, actor,
               schema::payload_t{{"reason", reason}},
               schema::compliance_tier_t::law_tier);
  maybe_build_evidence();
}

void engine::clear_emergency_stop(const std::string& actor) {
  log_.witness(schema::audit_event_kind_t::emergency_stop_cleared, actor, {},
               schema::compliance_tier_t::law_tier);
  halt_.clear();
  spdlog::info("engine: emergency stop cleared by '{}'", actor);
  maybe_build_evidence();
}

schema::evidence_record_t engine::build_evidence_record(
    const schema::log_range_t& range,
    const schema::compliance_tier_t tier) {
  auto lock = std::scoped_lock{evidence_mutex_};
  auto record = evidence_.build_record(range, tier);
  evidence_covered_until_ =
      std::max(evidence_covered_until_, range.last + 1);
  return record;
}

bool engine::verify_evidence_record(
    const schema::evidence_record_t& record) const {
  return evidence_.verify_record(record);
}

bool engine::verify_chain() const {
  if (!log_.verify_chain()) {
    return false;
  }
  auto size = log_.size();
  if (size == 0) {
    return true;
  }
  return log_.verify_signatures(schema::log_range_t{.first = 0,
                                                    .last = size - 1});
}

void engine::maybe_build_evidence() {
  if (options_.evidence_interval == 0) {
    return;
  }
  auto lock = std::scoped_lock{evidence_mutex_};
  auto size = log_.size();
  if (size < evidence_covered_until_ + options_.evidence_interval) {
    return;
  }
  auto range =
      schema::log_range_t{.first = evidence_covered_until_, .last = size - 1};
  try {
    evidence_.build_record(range);
    evidence_covered_until_ = size;
  } catch (const common::error& e) {
    // The span stays uncovered and is retried after the next unit of work.
    spdlog::error("engine: automatic evidence over [{}, {}] failed: {}",
                  range.first, range.last, e.what());
  }
}

schema::execution_mode_t engine::mode() const {
  return gate_.mode();
}

schema::account_t engine::account(const std::string& id) const {
  return ledger_.get_account(id);
}

std::vector<schema::account_t> engine::accounts() const {
  return ledger_.accounts();
}

std::optional<schema::transaction_t> engine::transaction(
    const std::string& transaction_id) const {
  auto lock = std::scoped_lock{transactions_mutex_};
  auto found = transactions_.find(transaction_id);
  if (found == std::end(transactions_)) {
    return std::nullopt;
  }
  return found->second;
}

schema::hash32_t engine::chain_head() const {
  return log_.head();
}

std::vector<schema::audit_event_t> engine::latest_events(
    const std::size_t count) const {
  return log_.latest(count);
}

std::optional<schema::evidence_record_t> engine::latest_evidence_record()
    const {
  return evidence_.latest();
}

engine_statistics engine::statistics() const {
  auto out = engine_statistics{.mode = gate_.mode(),
                               .halted = halt_.halted(),
                               .open_approvals = approvals_.tracked(),
                               .evidence_records = evidence_.size(),
                               .audit = log_.statistics()};
  auto lock = std::scoped_lock{transactions_mutex_};
  out.transactions = transactions_.size();
  for (const auto& [id, tx] : transactions_) {
    ++out.by_status[tx.status];
  }
  return out;
}

}  // namespace warden::execution
