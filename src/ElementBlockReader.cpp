#include "linetrim/io/ElementBlockReader.hpp"

#include <string>
#include <utility>

#include "linetrim/core/TrimError.hpp"
#include "linetrim/util/Parse.hpp"

namespace linetrim {

namespace {

inline TrimError malformed(const std::string& where, const std::string& msg) {
  return TrimError(TrimErrorKind::MalformedHeader, "ElementBlockReader: " + where + ": " + msg);
}

std::string strip_quotes(std::string_view s) {
  std::string out;
  for (char c : s) {
    if (c != '\'') out.push_back(c);
  }
  return out;
}

} // namespace

ElementBlockReader::ElementBlockReader(const LinelistText& text, std::string source_name)
: text_(text), source_name_(std::move(source_name)) {}

void ElementBlockReader::parse_header(std::string_view line, ElementBlock& block, const std::string& where) {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  if (toks.empty()) throw malformed(where, "empty element header");

  std::size_t count_tok = 0;
  if (toks[0].size() == 1) {
    // ' <species> ' <ion> <count>
    if (toks.size() < 5) {
      throw malformed(where, "expected 5 tokens in element header, got " + std::to_string(toks.size()) +
                             ": '" + std::string(line) + "'");
    }
    block.header_line_1 = std::string(toks[0]) + "   " + std::string(toks[1]) + "            " +
                          std::string(toks[2]) + "    " + std::string(toks[3]);
    block.species = strip_quotes(toks[1]);
    block.ionization = std::string(toks[3]);
    count_tok = 4;
  } else {
    // '<species> ' <ion> <count>
    if (toks.size() < 4) {
      throw malformed(where, "expected 4 tokens in element header, got " + std::to_string(toks.size()) +
                             ": '" + std::string(line) + "'");
    }
    block.header_line_1 = std::string(toks[0]) + " " + std::string(toks[1]) + "  " + std::string(toks[2]);
    block.species = strip_quotes(toks[0]);
    block.ionization = std::string(toks[2]);
    count_tok = 3;
  }

  std::size_t n = 0;
  if (!parse_int(toks[count_tok], n)) {
    throw malformed(where, "invalid line count '" + std::string(toks[count_tok]) + "'");
  }
  block.declared_lines = n;
}

bool ElementBlockReader::next(ElementBlock& block) {
  const std::size_t nlines = text_.size();
  while (cursor_ < nlines && is_blank(text_.line(cursor_))) ++cursor_;
  if (cursor_ >= nlines) return false;

  const std::string where = (source_name_.empty() ? std::string("line ") : source_name_ + ":") +
                            std::to_string(cursor_ + 1);

  block = ElementBlock{};
  block.header_line = cursor_;
  parse_header(text_.line(cursor_), block, where);

  if (cursor_ + 1 >= nlines) {
    throw malformed(where, "missing second element header line");
  }
  block.header_line_2 = text_.line(cursor_ + 1);
  block.first_data_line = cursor_ + 2;

  if (block.end_line() > nlines) {
    throw malformed(where, "element declares " + std::to_string(block.declared_lines) + " lines but only " +
                           std::to_string(nlines - block.first_data_line) + " remain");
  }

  cursor_ = block.end_line();
  ++blocks_read_;
  return true;
}

} // namespace linetrim
