#include <warden/common/error.hpp>
#include <warden/ledger/store.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace warden::ledger {

schema::account_t store::snapshot(const std::string& id, const slot& value) {
  return schema::account_t{id, value.balance, value.currency, value.history};
}

schema::account_t store::create_account(const std::string& id,
                                        const schema::amount_t& initial_balance,
                                        const std::string& currency,
                                        const account_witness_t& witness) {
  if (id.empty()) {
    throw common::error{common::error_code_t::invalid_input,
                        "account id must not be empty"};
  }
  if (currency.empty()) {
    throw common::error{common::error_code_t::invalid_input,
                        "currency must not be empty"};
  }
  if (initial_balance < 0) {
    throw common::error{
        common::error_code_t::invalid_input,
        fmt::format("initial balance {} of '{}' is negative",
                    schema::format_amount(initial_balance), id)};
  }

  auto lock = std::unique_lock{accounts_mutex_};
  if (accounts_.contains(id)) {
    throw common::error{common::error_code_t::duplicate_account,
                        fmt::format("account '{}' already exists", id)};
  }
  auto created = std::make_unique<slot>();
  created->balance = initial_balance;
  created->currency = currency;
  auto account = snapshot(id, *created);
  if (witness) {
    witness(account);
  }
  accounts_.emplace(id, std::move(created));
  spdlog::debug("ledger: created account '{}' with {} {}", id,
                schema::format_amount(initial_balance), currency);
  return account;
}

schema::account_t store::get_account(const std::string_view id) const {
  auto lock = std::shared_lock{accounts_mutex_};
  auto found = accounts_.find(id);
  if (found == std::end(accounts_)) {
    throw common::error{common::error_code_t::account_not_found,
                        fmt::format("account '{}' does not exist", id)};
  }
  auto slot_lock = std::scoped_lock{found->second->mutex};
  return snapshot(found->first, *found->second);
}

bool store::contains(const std::string_view id) const {
  auto lock = std::shared_lock{accounts_mutex_};
  return accounts_.find(id) != std::end(accounts_);
}

void store::validate(const schema::transaction_t& tx) const {
  if (tx.amount <= 0) {
    throw common::error{
        common::error_code_t::invalid_amount,
        fmt::format("transfer amount {} must be positive",
                    schema::format_amount(tx.amount))};
  }
  if (tx.from.empty() || tx.to.empty()) {
    throw common::error{common::error_code_t::invalid_input,
                        "transfer accounts must not be empty"};
  }
  if (tx.from == tx.to) {
    throw common::error{
        common::error_code_t::invalid_input,
        fmt::format("transfer from '{}' to itself", tx.from)};
  }
}

// Caller holds accounts_mutex_ (shared at least).
std::pair<store::slot*, store::slot*> store::find_pair(
    const schema::transaction_t& tx) const {
  auto from = accounts_.find(tx.from);
  if (from == std::end(accounts_)) {
    throw common::error{common::error_code_t::account_not_found,
                        fmt::format("account '{}' does not exist", tx.from)};
  }
  auto to = accounts_.find(tx.to);
  if (to == std::end(accounts_)) {
    throw common::error{common::error_code_t::account_not_found,
                        fmt::format("account '{}' does not exist", tx.to)};
  }
  return {from->second.get(), to->second.get()};
}

// Caller holds both account mutexes.
transfer_projection_t store::project_locked(const schema::transaction_t& tx,
                                            const slot& from,
                                            const slot& to) const {
  if (from.currency != tx.currency || to.currency != tx.currency) {
    throw common::error{
        common::error_code_t::currency_mismatch,
        fmt::format("transfer in {} between accounts holding {} and {}",
                    tx.currency, from.currency, to.currency)};
  }
  if (from.balance < tx.amount) {
    throw common::error{
        common::error_code_t::insufficient_funds,
        fmt::format("account '{}' holds {} {}, transfer needs {}", tx.from,
                    schema::format_amount(from.balance), from.currency,
                    schema::format_amount(tx.amount))};
  }
  if (to.balance > std::numeric_limits<schema::amount_t>::max() - tx.amount) {
    throw common::error{
        common::error_code_t::invalid_amount,
        fmt::format("crediting {} to '{}' would overflow its balance",
                    schema::format_amount(tx.amount), tx.to)};
  }

  auto from_history = from.history;
  from_history.push_back(tx.transaction_id);
  auto to_history = to.history;
  to_history.push_back(tx.transaction_id);
  return transfer_projection_t{
      .from = schema::account_t{tx.from, from.balance - tx.amount,
                                from.currency, std::move(from_history)},
      .to = schema::account_t{tx.to, to.balance + tx.amount, to.currency,
                              std::move(to_history)}};
}

std::pair<schema::account_t, schema::account_t> store::apply_transfer(
    const schema::transaction_t& tx,
    const transfer_witness_t& witness) {
  validate(tx);

  auto lock = std::shared_lock{accounts_mutex_};
  auto [from, to] = find_pair(tx);
  auto& first = tx.from < tx.to ? *from : *to;
  auto& second = tx.from < tx.to ? *to : *from;
  auto account_lock = std::scoped_lock{first.mutex, second.mutex};

  auto projection = project_locked(tx, *from, *to);
  if (witness) {
    witness(projection);
  }

  from->balance = projection.from.balance();
  from->history.push_back(tx.transaction_id);
  to->balance = projection.to.balance();
  to->history.push_back(tx.transaction_id);
  spdlog::debug("ledger: applied {} moving {} {} from '{}' to '{}'",
                tx.transaction_id, schema::format_amount(tx.amount),
                tx.currency, tx.from, tx.to);
  return {projection.from, projection.to};
}

transfer_projection_t store::project_transfer(
    const schema::transaction_t& tx,
    const transfer_witness_t& witness) const {
  validate(tx);

  auto lock = std::shared_lock{accounts_mutex_};
  auto [from, to] = find_pair(tx);
  auto& first = tx.from < tx.to ? *from : *to;
  auto& second = tx.from < tx.to ? *to : *from;
  auto account_lock = std::scoped_lock{first.mutex, second.mutex};

  auto projection = project_locked(tx, *from, *to);
  if (witness) {
    witness(projection);
  }
  return projection;
}

std::vector<schema::account_t> store::accounts() const {
  auto lock = std::shared_lock{accounts_mutex_};
  auto out = std::vector<schema::account_t>{};
  out.reserve(accounts_.size());
  for (const auto& [id, value] : accounts_) {
    auto slot_lock = std::scoped_lock{value->mutex};
    out.push_back(snapshot(id, *value));
  }
  return out;
}

schema::amount_t store::total_balance(const std::string_view currency) const {
  // Every slot stays locked until the sum is complete so that no transfer
  // is observed half applied.
  auto lock = std::shared_lock{accounts_mutex_};
  auto locks = std::vector<std::unique_lock<std::mutex>>{};
  locks.reserve(accounts_.size());
  for (const auto& [id, value] : accounts_) {
    locks.emplace_back(value->mutex);
  }
  auto total = schema::amount_t{0};
  for (const auto& [id, value] : accounts_) {
    if (value->currency == currency) {
      total += value->balance;
    }
  }
  return total;
}

}  // namespace warden::ledger
