#pragma once

#include <warden/common/clock.hpp>
#include <warden/schema/approval_request.hpp>

#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::execution {

/// Bookkeeping for the approval handshake. A request is claimed exactly
/// once (granted, denied or expired) and then completed once the engine has
/// finalized its transaction; waiters are released on completion or at
/// their deadline, whichever comes first. A completed request is forgotten
/// as soon as no waiter holds it.
class approval_desk final {
 public:
  approval_desk(std::chrono::milliseconds timeout,
                common::time_source_t now = common::system_time_source());

  approval_desk(const approval_desk&) = delete;
  approval_desk& operator=(const approval_desk&) = delete;

  schema::approval_request_t open(const std::string& transaction_id,
                                  const std::string& requested_by);

  /// Resolves a pending request. A resolution that arrives after the
  /// deadline becomes `expired`. Throws `approval_not_found` or
  /// `approval_already_resolved`.
  schema::approval_request_t claim(const std::string& request_id,
                                   bool granted,
                                   const std::string& resolver);

  /// Claims a pending request as expired; std::nullopt if it is no longer
  /// pending or no longer tracked.
  std::optional<schema::approval_request_t> expire(
      const std::string& request_id);

  /// Releases waiters and forgets the request once the last one has left.
  /// Unknown ids are ignored.
  void complete(const std::string& request_id) noexcept;

  /// Drops a request whose opening could not be witnessed.
  void discard(const std::string& request_id);

  /// Blocks for at most `bound`. True once the request is completed or no
  /// longer tracked.
  bool wait(const std::string& request_id, std::chrono::milliseconds bound);

  /// Time left until the deadline, zero when already past or no longer
  /// tracked.
  std::chrono::milliseconds remaining(const std::string& request_id) const;

  std::optional<schema::approval_request_t> find(
      const std::string& request_id) const;

  /// Pending requests whose deadline has passed.
  std::vector<std::string> overdue() const;

  /// Requests still open or being finalized.
  std::size_t tracked() const;

  std::chrono::milliseconds timeout() const { return timeout_; }

 private:
  struct entry final {
    schema::approval_request_t request;
    bool completed{false};
    std::size_t waiters{0};
  };

  using entries_t = std::map<std::string, entry>;

  entry& find_locked(const std::string& request_id);
  void release_locked(entries_t::iterator found);

  std::chrono::milliseconds timeout_;
  common::time_source_t now_;
  mutable std::mutex mutex_;
  std::condition_variable completed_;
  entries_t requests_;
};

}  // namespace warden::execution
