#pragma once

#include <cstddef>
#include <optional>

#include "linetrim/core/Segment.hpp"

namespace linetrim::alg::search {

// Binary searches over an ascending wavelength sequence exposed by `A.at(i)`
// (WavelengthCache, or any type with `double at(std::size_t)`).
// Both work on [low, high_end) and require low < high_end.

// Smallest i in [low, high_end) with A[i] >= x; high_end when x exceeds every value.
// An exact hit is walked back to the first element of its duplicate run; the
// walk is linear in the run length (worst case O(N) for an all-equal block).
template <class Values>
std::size_t left_bound(Values& A, std::size_t low, std::size_t high_end, double x) {
  const std::size_t high = high_end - 1;
  if (x <= A.at(low)) return low;
  if (x > A.at(high)) return high_end;

  std::size_t lo = low;
  std::size_t hi = high;
  while (lo <= hi) {
    std::size_t mid = lo + (hi - lo) / 2;
    const double v = A.at(mid);
    if (v < x) {
      lo = mid + 1;
    } else if (v > x) {
      if (mid == low) break;
      hi = mid - 1;
    } else {
      while (mid > low && A.at(mid - 1) == x) --mid;
      return mid;
    }
  }
  return lo;
}

// Largest i in [low, high_end) with A[i] <= x (upper bound minus one); low when
// x is below A[low]. Runs equal to x are included by construction.
template <class Values>
std::size_t right_bound(Values& A, std::size_t low, std::size_t high_end, double x) {
  const std::size_t high = high_end - 1;
  if (x < A.at(low)) return low;
  if (x >= A.at(high)) return high;

  std::size_t lo = low;
  std::size_t hi = high; // A[high] > x, so the answer is below high
  while (lo < hi) {
    const std::size_t mid = lo + (hi - lo) / 2;
    if (A.at(mid) <= x) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return lo - 1;
}

struct LineRange {
  std::size_t start = 0; // inclusive, block-local
  std::size_t stop = 0;  // exclusive

  std::size_t size() const { return stop - start; }
};

// Lines of a block (n = block size) falling inside `seg`, or nullopt.
template <class Values>
std::optional<LineRange> locate_window(Values& A, std::size_t n, const Segment& seg) {
  if (n == 0) return std::nullopt;
  const std::size_t left = left_bound(A, 0, n, seg.begin);
  if (left >= n || !seg.contains(A.at(left))) return std::nullopt;
  const std::size_t right = right_bound(A, left, n, seg.end);
  return LineRange{left, right + 1};
}

} // namespace linetrim::alg::search
