#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace lexrisk::core {

// Abstract clock interface for timestamp injection.
// Evaluation results carry an evaluated_at stamp and an execution time; neither is part of the
// canonical hash, but tests and replays need them fixed, so the engine never reads the system
// clock directly.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current wall-clock time in ISO 8601 format (UTC), e.g. "2026-01-01T00:00:00Z".
  [[nodiscard]] virtual std::string now_iso8601() const = 0;

  // Monotonic reading in microseconds, only meaningful as a difference of two readings.
  [[nodiscard]] virtual std::int64_t monotonic_micros() const = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: system_clock for timestamps, steady_clock for durations.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;

  [[nodiscard]] std::string now_iso8601() const override;
  [[nodiscard]] std::int64_t monotonic_micros() const override;
};

// Fixed clock: constant timestamp and zero elapsed time, for deterministic tests and replays.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  [[nodiscard]] std::string now_iso8601() const override { return fixed_time_; }
  [[nodiscard]] std::int64_t monotonic_micros() const override { return 0; }

 private:
  std::string fixed_time_;
};

}  // namespace lexrisk::core
