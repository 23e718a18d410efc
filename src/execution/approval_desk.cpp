#include <warden/common/error.hpp>
#include <warden/common/random.hpp>
#include <warden/execution/approval_desk.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace warden::execution {

approval_desk::approval_desk(const std::chrono::milliseconds timeout,
                             common::time_source_t now)
    : timeout_{timeout}, now_{std::move(now)} {}

approval_desk::entry& approval_desk::find_locked(
    const std::string& request_id) {
  auto found = requests_.find(request_id);
  if (found == std::end(requests_)) {
    throw common::error{
        common::error_code_t::approval_not_found,
        fmt::format("approval request '{}' does not exist", request_id)};
  }
  return found->second;
}

schema::approval_request_t approval_desk::open(
    const std::string& transaction_id,
    const std::string& requested_by) {
  auto request = schema::approval_request_t{};
  request.request_id = "AR-" + common::random_hex(16);
  request.transaction_id = transaction_id;
  request.requested_by = requested_by;
  request.requested_at = now_();
  request.deadline =
      request.requested_at + static_cast<uint64_t>(timeout_.count());

  auto lock = std::scoped_lock{mutex_};
  requests_.emplace(request.request_id, entry{.request = request});
  return request;
}

schema::approval_request_t approval_desk::claim(const std::string& request_id,
                                                const bool granted,
                                                const std::string& resolver) {
  auto lock = std::scoped_lock{mutex_};
  auto& found = find_locked(request_id);
  if (found.request.state != schema::approval_state_t::pending) {
    throw common::error{
        common::error_code_t::approval_already_resolved,
        fmt::format("approval request '{}' is already {}", request_id,
                    schema::to_string(found.request.state))};
  }
  if (now_() > found.request.deadline) {
    spdlog::warn("approval: '{}' resolved by '{}' after its deadline",
                 request_id, resolver);
    found.request.state = schema::approval_state_t::expired;
  } else {
    found.request.state = granted ? schema::approval_state_t::granted
                                  : schema::approval_state_t::denied;
  }
  found.request.resolved_by = resolver;
  return found.request;
}

std::optional<schema::approval_request_t> approval_desk::expire(
    const std::string& request_id) {
  auto lock = std::scoped_lock{mutex_};
  auto found = requests_.find(request_id);
  if (found == std::end(requests_) ||
      found->second.request.state != schema::approval_state_t::pending) {
    return std::nullopt;
  }
  found->second.request.state = schema::approval_state_t::expired;
  return found->second.request;
}

// Waiters keep their entry alive; the last one out erases it.
void approval_desk::release_locked(const entries_t::iterator found) {
  found->second.completed = true;
  if (found->second.waiters == 0) {
    requests_.erase(found);
  }
}

void approval_desk::complete(const std::string& request_id) noexcept {
  {
    auto lock = std::scoped_lock{mutex_};
    auto found = requests_.find(request_id);
    if (found == std::end(requests_)) {
      return;
    }
    release_locked(found);
  }
  completed_.notify_all();
}

void approval_desk::discard(const std::string& request_id) {
  {
    auto lock = std::scoped_lock{mutex_};
    auto found = requests_.find(request_id);
    if (found == std::end(requests_)) {
      return;
    }
    release_locked(found);
  }
  completed_.notify_all();
}

bool approval_desk::wait(const std::string& request_id,
                         const std::chrono::milliseconds bound) {
  auto lock = std::unique_lock{mutex_};
  auto found = requests_.find(request_id);
  if (found == std::end(requests_)) {
    return true;
  }
  ++found->second.waiters;
  auto done = completed_.wait_for(
      lock, bound, [&] { return found->second.completed; });
  --found->second.waiters;
  if (found->second.completed && found->second.waiters == 0) {
    requests_.erase(found);
  }
  return done;
}

std::chrono::milliseconds approval_desk::remaining(
    const std::string& request_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = requests_.find(request_id);
  if (found == std::end(requests_)) {
    return std::chrono::milliseconds{0};
  }
  auto now = now_();
  if (now >= found->second.request.deadline) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::milliseconds{found->second.request.deadline - now};
}

std::optional<schema::approval_request_t> approval_desk::find(
    const std::string& request_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = requests_.find(request_id);
  if (found == std::end(requests_)) {
    return std::nullopt;
  }
  return found->second.request;
}

std::vector<std::string> approval_desk::overdue() const {
  auto lock = std::scoped_lock{mutex_};
  auto now = now_();
  auto out = std::vector<std::string>{};
  for (const auto& [id, value] : requests_) {
    if (value.request.state == schema::approval_state_t::pending &&
        now > value.request.deadline) {
      out.push_back(id);
    }
  }
  return out;
}

std::size_t approval_desk::tracked() const {
  auto lock = std::scoped_lock{mutex_};
  return requests_.size();
}

}  // namespace warden::execution
