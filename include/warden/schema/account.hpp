#pragma once

#include <warden/schema/primitives.hpp>

#include <string>
#include <utility>
#include <vector>

namespace warden::ledger {
class store;
}  // namespace warden::ledger

namespace warden::schema {

/// Read-only account snapshot. Only the ledger store constructs these.
class account_t final {
 public:
  const std::string& id() const { return id_; }
  const amount_t& balance() const { return balance_; }
  const std::string& currency() const { return currency_; }
  const std::vector<std::string>& history() const { return history_; }

 private:
  friend class warden::ledger::store;

  account_t(std::string id,
            amount_t balance,
            std::string currency,
            std::vector<std::string> history)
      : id_{std::move(id)},
        balance_{std::move(balance)},
        currency_{std::move(currency)},
        history_{std::move(history)} {}

  std::string id_;
  amount_t balance_;
  std::string currency_;
  std::vector<std::string> history_;
};

}  // namespace warden::schema
