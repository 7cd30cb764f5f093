#pragma once

#include <cstdint>
#include <memory>

#include <sessionvault/internal.hpp>

namespace sessionvault {

/**
 * Injectable wall clock (milliseconds since epoch).
 * Production code uses RealClock; tests inject testing::FakeClock.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t NowMillis() const = 0;
};

class RealClock : public Clock {
 public:
  uint64_t NowMillis() const override { return internal::WallClockMillis(); }
};

inline std::shared_ptr<Clock> DefaultClock() {
  static std::shared_ptr<Clock> clock = std::make_shared<RealClock>();
  return clock;
}

}  // namespace sessionvault
