#pragma once

#include <warden/config/config.hpp>
#include <warden/crypto/signature_authority.hpp>
#include <warden/sandbox.hpp>
#include <warden/schema/approval_token.hpp>
#include <warden/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace warden::testing {

/// A sandbox signing with the test scheme and trusting one promotion
/// approver, "approver-1". `adjust` runs on the configuration before the
/// sandbox is built.
class sandbox_fixture final {
 public:
  explicit sandbox_fixture(
      const std::function<void(warden::config::sandbox_config&)>& adjust = {})
      : approver_{std::make_unique<warden::crypto::signature_authority>(
            "approver-1", test_scheme())},
        config_{make_config(*approver_, adjust)},
        sandbox_{std::make_unique<warden::sandbox>(config_)} {}

  sandbox_fixture(const sandbox_fixture&) = delete;
  sandbox_fixture& operator=(const sandbox_fixture&) = delete;
  sandbox_fixture(sandbox_fixture&&) = delete;
  sandbox_fixture& operator=(sandbox_fixture&&) = delete;

  warden::sandbox& sandbox() { return *sandbox_; }
  warden::execution::engine& engine() { return sandbox_->engine(); }
  warden::audit::log& audit_log() { return sandbox_->audit_log(); }
  const warden::config::sandbox_config& config() const { return config_; }
  const warden::crypto::signature_authority& approver() const {
    return *approver_;
  }

  warden::schema::approval_token_t token(
      const warden::schema::execution_mode_t from,
      const warden::schema::execution_mode_t to) const {
    return make_token(*approver_, from, to);
  }

  /// Delays the `nth` audit signature from now on (0 is the next one).
  /// Every event is still signed by the sandbox authority.
  void delay_signature(const std::size_t nth,
                       const std::chrono::milliseconds delay) {
    auto calls = std::make_shared<std::atomic<std::size_t>>(0);
    const auto& authority = sandbox_->authority();
    audit_log().set_signer(
        [calls, nth, delay, &authority](const warden::schema::hash32_t& digest) {
          if ((*calls)++ == nth) {
            std::this_thread::sleep_for(delay);
          }
          return authority.sign_envelope(digest);
        });
  }

  /// Promotes the engine up to `target` one tier at a time.
  void promote_to(const warden::schema::execution_mode_t target) {
    while (engine().mode() != target) {
      auto from = engine().mode();
      auto to = *warden::schema::next_mode(from);
      engine().promote(to, token(from, to), "operator");
    }
  }

 private:
  static warden::config::sandbox_config make_config(
      const warden::crypto::signature_authority& approver,
      const std::function<void(warden::config::sandbox_config&)>& adjust) {
    auto config = warden::config::sandbox_config{};
    config.signature_scheme = test_scheme();
    config.trusted_approvers.push_back(warden::execution::trusted_approver_t{
        .approver_id = approver.signer_id(),
        .public_key = approver.public_key()});
    if (adjust) {
      adjust(config);
    }
    return config;
  }

  std::unique_ptr<warden::crypto::signature_authority> approver_;
  warden::config::sandbox_config config_;
  std::unique_ptr<warden::sandbox> sandbox_;
};

}  // namespace warden::testing
