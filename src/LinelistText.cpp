#include "linetrim/io/LinelistText.hpp"

#include <utility>

#include "linetrim/util/AtomicFile.hpp"

namespace linetrim {

LinelistText::LinelistText(LinelistText&& other) : buf_(std::move(other.buf_)) {
  index_lines_();
  other.lines_.clear();
}

LinelistText& LinelistText::operator=(LinelistText&& other) {
  if (this != &other) {
    buf_ = std::move(other.buf_);
    index_lines_();
    other.lines_.clear();
  }
  return *this;
}

LinelistText LinelistText::load(const std::filesystem::path& path) {
  return from_string(util::read_file_bytes(path));
}

LinelistText LinelistText::from_string(std::string text) {
  LinelistText t;
  t.buf_ = std::move(text);
  t.index_lines_();
  return t;
}

void LinelistText::index_lines_() {
  lines_.clear();
  const char* data = buf_.data();
  const std::size_t n = buf_.size();
  std::size_t start = 0;
  while (start < n) {
    std::size_t nl = buf_.find('\n', start);
    const std::size_t stop = (nl == std::string::npos) ? n : nl;
    std::size_t len = stop - start;
    if (len > 0 && data[start + len - 1] == '\r') --len;
    lines_.emplace_back(data + start, len);
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
}

} // namespace linetrim
