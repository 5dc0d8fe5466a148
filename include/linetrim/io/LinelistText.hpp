#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace linetrim {

// Whole-file view of a line list: one byte buffer plus a view per line
// (line terminators removed, CRLF normalized). Views stay valid for the
// lifetime of the object; it is movable but not copyable. Moves re-index the
// buffer because short strings do not keep their storage across a move.
class LinelistText {
public:
  LinelistText() = default;

  static LinelistText load(const std::filesystem::path& path);
  static LinelistText from_string(std::string text);

  LinelistText(LinelistText&& other);
  LinelistText& operator=(LinelistText&& other);
  LinelistText(const LinelistText&) = delete;
  LinelistText& operator=(const LinelistText&) = delete;

  std::size_t size() const { return lines_.size(); }
  bool empty() const { return lines_.empty(); }
  std::string_view line(std::size_t i) const { return lines_[i]; }
  const std::vector<std::string_view>& lines() const { return lines_; }

private:
  std::string buf_;
  std::vector<std::string_view> lines_;

  void index_lines_();
};

} // namespace linetrim
