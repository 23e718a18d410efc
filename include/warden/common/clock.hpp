#pragma once

#include <warden/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace warden::common {

/// Wall-clock source in milliseconds since the epoch. Injected so that
/// deadlines and timestamps can be driven from tests.
using time_source_t = std::function<schema::timestamp_milliseconds_t()>;

inline schema::timestamp_milliseconds_t now_milliseconds() {
  return static_cast<schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

inline time_source_t system_time_source() {
  return [] { return now_milliseconds(); };
}

}  // namespace warden::common
