#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace linetrim {

struct Segment {
  double begin = 0.0;
  double end = 0.0;

  bool contains(double w) const { return begin <= w && w <= end; }
};

// Sorted, immutable collection of wavelength windows plus the [min begin, max end]
// envelope used to reject element blocks in O(1).
class SegmentSet {
public:
  SegmentSet() = default;

  explicit SegmentSet(std::vector<Segment> segs) : segs_(std::move(segs)) {
    if (segs_.empty()) {
      throw std::runtime_error("SegmentSet: at least one segment is required");
    }
    for (std::size_t i = 0; i < segs_.size(); ++i) {
      const auto& s = segs_[i];
      if (!std::isfinite(s.begin) || !std::isfinite(s.end)) {
        throw std::runtime_error("SegmentSet: segment " + std::to_string(i) + " has a non-finite bound");
      }
      if (s.begin > s.end) {
        throw std::runtime_error("SegmentSet: segment " + std::to_string(i) + " has begin > end");
      }
    }
    std::stable_sort(segs_.begin(), segs_.end(),
                     [](const Segment& a, const Segment& b) { return a.begin < b.begin; });
    env_min_ = segs_.front().begin;
    env_max_ = segs_.front().end;
    for (const auto& s : segs_) env_max_ = std::max(env_max_, s.end);
  }

  static SegmentSet from_bounds(const std::vector<double>& begins, const std::vector<double>& ends) {
    if (begins.size() != ends.size()) {
      throw std::runtime_error("SegmentSet: begins/ends length mismatch (" + std::to_string(begins.size()) +
                               " vs " + std::to_string(ends.size()) + ")");
    }
    std::vector<Segment> segs;
    segs.reserve(begins.size());
    for (std::size_t i = 0; i < begins.size(); ++i) segs.push_back({begins[i], ends[i]});
    return SegmentSet(std::move(segs));
  }

  std::size_t size() const { return segs_.size(); }
  bool empty() const { return segs_.empty(); }
  const Segment& operator[](std::size_t i) const { return segs_[i]; }
  auto begin() const { return segs_.begin(); }
  auto end() const { return segs_.end(); }

  double envelope_min() const { return env_min_; }
  double envelope_max() const { return env_max_; }

  // True when [lo, hi] cannot intersect any segment.
  bool outside_envelope(double lo, double hi) const {
    return hi < env_min_ || lo > env_max_;
  }

private:
  std::vector<Segment> segs_;
  double env_min_ = 0.0;
  double env_max_ = 0.0;
};

} // namespace linetrim
