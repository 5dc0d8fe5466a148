#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "linetrim/core/TrimError.hpp"
#include "linetrim/io/LinelistText.hpp"
#include "linetrim/util/Parse.hpp"

namespace linetrim::alg::search {

// Sparse memo of parsed wavelengths for the data lines of one element block.
// Binary searches touch O(log N) lines per segment; with many segments the
// same probes repeat, and the float parse dominates the cost.
//
// Index space is block-local: at(i) reads text line (offset + i).
// bind() rebinds the arena to the next block and drops all entries.
class WavelengthCache {
public:
  WavelengthCache() = default;
  WavelengthCache(const LinelistText& text, std::size_t offset, std::size_t count) {
    bind(text, offset, count);
  }

  void bind(const LinelistText& text, std::size_t offset, std::size_t count) {
    text_ = &text;
    offset_ = offset;
    count_ = count;
    memo_.clear();
  }

  std::size_t size() const { return count_; }
  std::size_t parsed() const { return memo_.size(); }
  std::size_t offset() const { return offset_; }

  // Throws TrimError(MalformedRecord) when column 0 is not a number.
  double at(std::size_t i) {
    auto it = memo_.find(i);
    if (it != memo_.end()) return it->second;
    double w = 0.0;
    const auto line = text_->line(offset_ + i);
    if (!parse_column_double(line, 0, w)) {
      throw TrimError(TrimErrorKind::MalformedRecord,
                      "invalid wavelength on line " + std::to_string(offset_ + i + 1) + ": '" + std::string(line) + "'");
    }
    memo_.emplace(i, w);
    return w;
  }

  double front() { return at(0); }
  double back() { return at(count_ - 1); }

private:
  const LinelistText* text_ = nullptr;
  std::size_t offset_ = 0;
  std::size_t count_ = 0;
  std::unordered_map<std::size_t, double> memo_;
};

} // namespace linetrim::alg::search
