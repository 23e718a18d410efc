#include <warden/blake3/hash.hpp>
#include <warden/common/error.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/execution/gate.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <tuple>
#include <utility>

namespace warden::execution {

namespace {

[[noreturn]] void refuse(const std::string& reason) {
  spdlog::warn("gate: promotion refused: {}", reason);
  throw common::error{common::error_code_t::unauthorized_promotion, reason};
}

}  // namespace

schema::hash32_t make_promotion_digest(
    const schema::execution_mode_t from,
    const schema::execution_mode_t to,
    const std::string& approver_id,
    const schema::timestamp_milliseconds_t issued_at) {
  auto encoder = schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{std::string{"warden-promotion-v1"},
                                           from, to, approver_id, issued_at});
  return blake3::hash(schema::make_bytes_view(encoded));
}

gate::gate(gate_options options) : options_{std::move(options)} {}

schema::execution_mode_t gate::mode() const {
  auto lock = std::shared_lock{mutex_};
  return mode_;
}

schema::decision_t gate::decide(const schema::execution_mode_t mode,
                                const schema::amount_t& amount) const {
  switch (mode) {
    case schema::execution_mode_t::shadow:
      return schema::simulate_t{};
    case schema::execution_mode_t::pilot:
      if (amount <= options_.pilot_auto_commit_limit) {
        return schema::commit_t{};
      }
      return schema::require_approval_t{
          .reason = "amount exceeds the PILOT auto-commit limit",
          .limit = options_.pilot_auto_commit_limit};
    case schema::execution_mode_t::production:
      if (amount <= options_.production_auto_commit_limit) {
        return schema::commit_t{};
      }
      return schema::require_approval_t{
          .reason = "amount exceeds the PRODUCTION auto-commit limit",
          .limit = options_.production_auto_commit_limit};
  }
  return schema::simulate_t{};
}

authorization_t gate::authorize(
    const schema::transaction_intent_t& intent) const {
  auto hold = std::shared_lock{mutex_};
  auto decision = decide(mode_, intent.amount);
  return authorization_t{
      .decision = std::move(decision), .mode = mode_, .hold = std::move(hold)};
}

void gate::promote(const schema::execution_mode_t target,
                   const std::optional<schema::approval_token_t>& token,
                   const transition_witness_t& witness) {
  auto lock = std::unique_lock{mutex_};
  auto from = mode_;

  if (!token) {
    refuse(fmt::format("promotion {} -> {} presented no approval token",
                       schema::to_string(from), schema::to_string(target)));
  }
  auto next = schema::next_mode(from);
  if (!next || *next != target) {
    refuse(fmt::format("{} -> {} is not a single-tier promotion",
                       schema::to_string(from), schema::to_string(target)));
  }
  if (token->from != from || token->to != target) {
    refuse(fmt::format("token authorizes {} -> {}, requested {} -> {}",
                       schema::to_string(token->from),
                       schema::to_string(token->to), schema::to_string(from),
                       schema::to_string(target)));
  }
  auto approver = std::find_if(
      std::begin(options_.trusted_approvers),
      std::end(options_.trusted_approvers),
      [&](const trusted_approver_t& candidate) {
        return candidate.approver_id == token->approver_id;
      });
  if (approver == std::end(options_.trusted_approvers)) {
    refuse(fmt::format("approver '{}' is not trusted", token->approver_id));
  }
  auto digest = make_promotion_digest(token->from, token->to,
                                      token->approver_id, token->issued_at);
  if (!crypto::verify(digest, schema::make_bytes_view(token->signature),
                      approver->public_key)) {
    refuse(fmt::format("approval signature of '{}' does not verify",
                       token->approver_id));
  }

  if (witness) {
    witness(from, target, *token);
  }
  mode_ = target;
  spdlog::info("gate: promoted {} -> {} on approval of '{}'",
               schema::to_string(from), schema::to_string(target),
               token->approver_id);
}

}  // namespace warden::execution
