#pragma once

#include <warden/schema/account.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::ledger {

/// Both accounts as they stand after a transfer, history included.
struct transfer_projection_t final {
  schema::account_t from;
  schema::account_t to;
};

/// Runs under the store's locks before the new state is published. If it
/// throws, nothing is published.
using account_witness_t = std::function<void(const schema::account_t&)>;
using transfer_witness_t = std::function<void(const transfer_projection_t&)>;

/// Sole owner of real balances. Each account has its own mutex; transfers
/// lock both accounts in identifier order.
class store final {
 public:
  store() = default;

  store(const store&) = delete;
  store& operator=(const store&) = delete;
  store(store&&) = delete;
  store& operator=(store&&) = delete;

  schema::account_t create_account(const std::string& id,
                                   const schema::amount_t& initial_balance,
                                   const std::string& currency,
                                   const account_witness_t& witness = {});

  schema::account_t get_account(std::string_view id) const;
  bool contains(std::string_view id) const;

  /// Debit, credit and history append as one step.
  std::pair<schema::account_t, schema::account_t> apply_transfer(
      const schema::transaction_t& tx,
      const transfer_witness_t& witness = {});

  /// Same validation and locking as apply_transfer; publishes nothing.
  transfer_projection_t project_transfer(
      const schema::transaction_t& tx,
      const transfer_witness_t& witness = {}) const;

  std::vector<schema::account_t> accounts() const;

  /// Sum of real balances held in `currency`.
  schema::amount_t total_balance(std::string_view currency) const;

 private:
  struct slot final {
    mutable std::mutex mutex;
    schema::amount_t balance;
    std::string currency;
    std::vector<std::string> history;
  };

  static schema::account_t snapshot(const std::string& id, const slot& value);

  void validate(const schema::transaction_t& tx) const;
  std::pair<slot*, slot*> find_pair(const schema::transaction_t& tx) const;
  transfer_projection_t project_locked(const schema::transaction_t& tx,
                                       const slot& from,
                                       const slot& to) const;

  mutable std::shared_mutex accounts_mutex_;
  std::map<std::string, std::unique_ptr<slot>, std::less<>> accounts_;
};

}  // namespace warden::ledger
