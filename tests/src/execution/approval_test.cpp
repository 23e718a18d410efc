#include <warden/common/error.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/sandbox_fixture.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

using warden::schema::audit_event_kind_t;
using warden::schema::execution_mode_t;
using warden::schema::transaction_status_t;
using warden::testing::amount;

namespace {

/// PILOT with the given auto-commit limit and approval timeout, accounts A
/// (500.00) and B (250.00).
class approval_test : public ::testing::Test {
 protected:
  void start(const std::string_view limit = "0",
             const std::chrono::milliseconds timeout =
                 std::chrono::milliseconds{30000}) {
    fixture_ = std::make_unique<warden::testing::sandbox_fixture>(
        [&](warden::config::sandbox_config& config) {
          config.pilot_auto_commit_limit = amount(limit);
          config.approval_timeout = timeout;
        });
    engine().create_account("A", amount("500.00"), "USD", "operator");
    engine().create_account("B", amount("250.00"), "USD", "operator");
    fixture_->promote_to(execution_mode_t::pilot);
  }

  warden::execution::engine& engine() { return fixture_->engine(); }
  std::vector<warden::schema::audit_event_t> events() {
    return fixture_->audit_log().events();
  }

  warden::schema::transaction_t request(const std::string_view value) {
    auto tx = engine().simulate_transaction("A", "B", amount(value), "USD",
                                            "tester");
    EXPECT_EQ(tx.status, transaction_status_t::approval_required);
    EXPECT_TRUE(tx.approval_request_id.has_value());
    return tx;
  }

  warden::common::error_code_t resolve_code(const std::string& request_id) {
    try {
      engine().resolve_approval(request_id, true, "reviewer");
    } catch (const warden::common::error& e) {
      return e.code();
    }
    ADD_FAILURE() << "resolution unexpectedly succeeded";
    return warden::common::error_code_t::crypto_failure;
  }

  std::unique_ptr<warden::testing::sandbox_fixture> fixture_;
};

}  // namespace

TEST_F(approval_test, request_leaves_balances_untouched) {
  start();
  auto tx = request("10.00");
  EXPECT_TRUE(tx.witnessed);
  EXPECT_EQ(tx.mode, execution_mode_t::pilot);
  EXPECT_EQ(engine().account("A").balance(), amount("500.00"));

  auto all = events();
  EXPECT_EQ(warden::testing::count_kind(all,
                                        audit_event_kind_t::approval_requested),
            1u);
  EXPECT_EQ(warden::testing::count_outcomes(all, tx.transaction_id,
                                            "APPROVAL_REQUIRED"),
            1u);
  auto requested = fixture_->audit_log().at(*tx.audit_sequence);
  EXPECT_EQ(warden::schema::find_field(requested->payload,
                                       "approval_request_id"),
            std::string_view{*tx.approval_request_id});
}

TEST_F(approval_test, grant_settles_the_transfer) {
  start();
  auto tx = request("10.00");
  auto settled =
      engine().resolve_approval(*tx.approval_request_id, true, "reviewer");

  EXPECT_EQ(settled.transaction_id, tx.transaction_id);
  EXPECT_EQ(settled.status, transaction_status_t::executed);
  EXPECT_EQ(engine().account("A").balance(), amount("490.00"));
  EXPECT_EQ(engine().account("B").balance(), amount("260.00"));
  EXPECT_EQ(engine().transaction(tx.transaction_id)->status,
            transaction_status_t::executed);

  auto all = events();
  EXPECT_EQ(
      warden::testing::count_kind(all, audit_event_kind_t::approval_granted),
      1u);
  EXPECT_EQ(
      warden::testing::count_outcomes(all, tx.transaction_id, "EXECUTED"), 1u);
  auto committed = fixture_->audit_log().at(*settled.audit_sequence);
  EXPECT_EQ(committed->kind, audit_event_kind_t::transaction_committed);
  EXPECT_EQ(warden::schema::find_field(committed->payload, "approver"),
            "reviewer");
  EXPECT_TRUE(engine().verify_chain());
}

TEST_F(approval_test, denial_rejects_without_settlement) {
  start();
  auto tx = request("10.00");
  auto denied =
      engine().resolve_approval(*tx.approval_request_id, false, "reviewer");

  EXPECT_EQ(denied.status, transaction_status_t::rejected);
  EXPECT_EQ(denied.rejection_reason, "approval_denied");
  EXPECT_EQ(engine().account("A").balance(), amount("500.00"));
  auto all = events();
  EXPECT_EQ(
      warden::testing::count_kind(all, audit_event_kind_t::approval_denied), 1u);
  EXPECT_EQ(
      warden::testing::count_outcomes(all, tx.transaction_id, "REJECTED"), 1u);
}

TEST_F(approval_test, requests_resolve_once) {
  start();
  auto tx = request("10.00");
  engine().resolve_approval(*tx.approval_request_id, false, "reviewer");
  EXPECT_EQ(resolve_code(*tx.approval_request_id),
            warden::common::error_code_t::approval_already_resolved);
  EXPECT_EQ(resolve_code("AR-unknown"),
            warden::common::error_code_t::approval_not_found);
  EXPECT_EQ(engine().account("A").balance(), amount("500.00"));
}

TEST_F(approval_test, small_amounts_commit_without_a_request) {
  start("100.00");
  auto tx =
      engine().simulate_transaction("A", "B", amount("100.00"), "USD", "tester");
  EXPECT_EQ(tx.status, transaction_status_t::executed);
  EXPECT_FALSE(tx.approval_request_id.has_value());
  request("100.01");
}

TEST_F(approval_test, unanswered_requests_time_out_to_rejection) {
  start("0", std::chrono::milliseconds{50});
  auto tx = request("10.00");

  auto started = std::chrono::steady_clock::now();
  auto expired = engine().await_approval(*tx.approval_request_id);
  auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(expired.status, transaction_status_t::rejected);
  EXPECT_EQ(expired.rejection_reason, "approval_expired");
  EXPECT_LT(waited, std::chrono::seconds{5});
  EXPECT_EQ(engine().account("A").balance(), amount("500.00"));
  EXPECT_EQ(
      warden::testing::count_kind(events(), audit_event_kind_t::approval_expired),
      1u);

  // The request is closed now.
  EXPECT_EQ(resolve_code(*tx.approval_request_id),
            warden::common::error_code_t::approval_already_resolved);
}

TEST_F(approval_test, late_grant_is_recorded_as_expired) {
  start("0", std::chrono::milliseconds{50});
  auto tx = request("10.00");
  std::this_thread::sleep_for(std::chrono::milliseconds{120});

  auto late =
      engine().resolve_approval(*tx.approval_request_id, true, "reviewer");
  EXPECT_EQ(late.status, transaction_status_t::rejected);
  EXPECT_EQ(late.rejection_reason, "approval_expired");
  EXPECT_EQ(engine().account("A").balance(), amount("500.00"));
}

TEST_F(approval_test, sweep_expires_overdue_requests) {
  start("0", std::chrono::milliseconds{50});
  auto first = request("10.00");
  auto second = request("20.00");
  std::this_thread::sleep_for(std::chrono::milliseconds{120});

  auto expired = engine().expire_approvals();
  ASSERT_EQ(expired.size(), 2u);
  for (const auto& tx : expired) {
    EXPECT_EQ(tx.rejection_reason, "approval_expired");
  }
  EXPECT_TRUE(engine().expire_approvals().empty());
  EXPECT_EQ(engine().transaction(first.transaction_id)->status,
            transaction_status_t::rejected);
  EXPECT_EQ(engine().transaction(second.transaction_id)->status,
            transaction_status_t::rejected);
}

TEST_F(approval_test, waiter_is_released_by_a_grant) {
  start();
  auto tx = request("10.00");

  auto awaited = warden::schema::transaction_t{};
  auto waiter = std::thread{[&] {
    awaited = engine().await_approval(*tx.approval_request_id);
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds{20});
  engine().resolve_approval(*tx.approval_request_id, true, "reviewer");
  waiter.join();

  EXPECT_EQ(awaited.status, transaction_status_t::executed);
  EXPECT_EQ(engine().account("B").balance(), amount("260.00"));
}

TEST_F(approval_test, funds_are_rechecked_at_grant_time) {
  start("100.00");
  auto tx = request("400.00");
  engine().simulate_transaction("A", "B", amount("100.00"), "USD", "tester");
  engine().simulate_transaction("A", "B", amount("100.00"), "USD", "tester");
  EXPECT_EQ(engine().account("A").balance(), amount("300.00"));

  auto granted =
      engine().resolve_approval(*tx.approval_request_id, true, "reviewer");
  EXPECT_EQ(granted.status, transaction_status_t::rejected);
  EXPECT_EQ(granted.rejection_reason, "insufficient_funds");
  EXPECT_EQ(engine().account("A").balance(), amount("300.00"));
  EXPECT_EQ(warden::testing::count_outcomes(events(), tx.transaction_id,
                                            "REJECTED"),
            1u);
}

TEST_F(approval_test, unknown_requests_cannot_be_awaited) {
  start();
  try {
    engine().await_approval("AR-missing");
    ADD_FAILURE() << "unknown request awaited";
  } catch (const warden::common::error& e) {
    EXPECT_EQ(e.code(), warden::common::error_code_t::approval_not_found);
  }
}

TEST_F(approval_test, closed_requests_leave_the_desk) {
  start("0", std::chrono::milliseconds{200});
  auto granted = request("10.00");
  auto denied = request("20.00");
  auto unanswered = request("30.00");
  EXPECT_EQ(fixture_->sandbox().approvals().tracked(), 3u);

  engine().resolve_approval(*granted.approval_request_id, true, "reviewer");
  engine().resolve_approval(*denied.approval_request_id, false, "reviewer");
  std::this_thread::sleep_for(std::chrono::milliseconds{300});
  EXPECT_EQ(engine().expire_approvals().size(), 1u);
  EXPECT_EQ(fixture_->sandbox().approvals().tracked(), 0u);

  // Outcomes stay reachable through the request ids.
  EXPECT_EQ(engine().await_approval(*granted.approval_request_id).status,
            transaction_status_t::executed);
  EXPECT_EQ(
      engine().await_approval(*unanswered.approval_request_id).rejection_reason,
      "approval_expired");
  EXPECT_EQ(resolve_code(*denied.approval_request_id),
            warden::common::error_code_t::approval_already_resolved);
  EXPECT_EQ(engine().account("B").balance(), amount("260.00"));
}
