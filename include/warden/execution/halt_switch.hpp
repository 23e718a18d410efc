#pragma once

#include <atomic>

namespace warden::execution {

/// Operator emergency stop. Polled before every unit of work.
class halt_switch final {
 public:
  void assert_halt() noexcept { halted_.store(true); }
  void clear() noexcept { halted_.store(false); }
  bool halted() const noexcept { return halted_.load(); }

 private:
  std::atomic<bool> halted_{false};
};

}  // namespace warden::execution
