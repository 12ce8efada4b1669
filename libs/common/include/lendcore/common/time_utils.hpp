#pragma once

#include <atomic>
#include <chrono>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

class Clock {
 public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] Timestamp now() const override {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

// Clock driven by hand; used by scripted runs and tests.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(Timestamp start = 0) noexcept : now_(start) {}

  [[nodiscard]] Timestamp now() const override { return now_.load(); }
  void set(Timestamp value) noexcept { now_.store(value); }
  void advance(Timestamp seconds) noexcept { now_.fetch_add(seconds); }

 private:
  std::atomic<Timestamp> now_;
};

}  // namespace common
}  // namespace lendcore
