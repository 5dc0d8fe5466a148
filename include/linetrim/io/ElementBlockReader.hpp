#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "linetrim/core/ElementBlock.hpp"
#include "linetrim/io/LinelistText.hpp"

namespace linetrim {

// Walks a LinelistText block by block. Each call to next() consumes one
// element header (two lines) plus its declared data lines.
//
// Header line 1 comes in two shapes, depending on whether the opening quote is
// detached from the species token:
//   '   3.000            '    1   13   -> 5 tokens, count in token 4
//   '3.000               '    1   13   -> 4 tokens, count in token 3
// Any other shape, a bad count, or a truncated block throws
// TrimError(MalformedHeader): the cursor cannot be resynchronized safely.
class ElementBlockReader {
public:
  explicit ElementBlockReader(const LinelistText& text, std::string source_name = std::string());

  // Returns false once only blank lines remain.
  bool next(ElementBlock& block);

  std::size_t cursor() const { return cursor_; }
  std::size_t blocks_read() const { return blocks_read_; }

  // Rebuild header line 1 (without count) and extract the count from a header line.
  // Exposed for tests; throws TrimError(MalformedHeader).
  static void parse_header(std::string_view line, ElementBlock& block, const std::string& where);

private:
  const LinelistText& text_;
  std::string source_name_;
  std::size_t cursor_ = 0;
  std::size_t blocks_read_ = 0;
};

} // namespace linetrim
