#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace linetrim {

// One species/ionization run inside a line list: two header lines followed by
// `declared_lines` wavelength-sorted data lines. Data lines are addressed by
// index into the owning LinelistText (first_data_line .. first_data_line + N).
struct ElementBlock {
  std::string species;          // species token without quotes, e.g. "26.000"
  std::string ionization;       // ionization token, e.g. "1"
  std::string header_line_1;    // rebuilt header without the count
  std::string_view header_line_2; // verbatim second header line (view into file buffer)
  std::size_t declared_lines = 0;
  std::size_t header_line = 0;  // line index of header line 1
  std::size_t first_data_line = 0;

  std::size_t end_line() const { return first_data_line + declared_lines; }
};

} // namespace linetrim
