#pragma once

#include <chrono>
#include <cstdint>

namespace linetrim {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  void reset() { t0_ = clock::now(); }

  double elapsed_seconds() const {
    const auto dt = clock::now() - t0_;
    return std::chrono::duration_cast<std::chrono::duration<double>>(dt).count();
  }

  std::int64_t elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0_).count();
  }

private:
  clock::time_point t0_;
};

// Adds the lifetime of the scope to *accumulator (no-op for nullptr).
class ScopedTimer {
public:
  explicit ScopedTimer(double* accumulator) : acc_(accumulator) {}
  ~ScopedTimer() {
    if (acc_) *acc_ += t_.elapsed_seconds();
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  double* acc_ = nullptr;
  WallTimer t_;
};

} // namespace linetrim
