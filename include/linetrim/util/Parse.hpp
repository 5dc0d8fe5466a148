#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace linetrim {

inline bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

inline void split_ws(std::string_view s, std::vector<std::string_view>& out) {
  out.clear();
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    while (i < n && is_ws(s[i])) ++i;
    if (i >= n) break;
    std::size_t j = i;
    while (j < n && !is_ws(s[j])) ++j;
    out.emplace_back(s.substr(i, j - i));
    i = j;
  }
}

// Advance `p` past the next whitespace-delimited token. Returns false when only
// whitespace remains.
inline bool next_token(const char*& p, const char* end, std::string_view& tok) {
  while (p < end && is_ws(*p)) ++p;
  if (p >= end) {
    tok = std::string_view{};
    return false;
  }
  const char* start = p;
  while (p < end && !is_ws(*p)) ++p;
  tok = std::string_view(start, static_cast<std::size_t>(p - start));
  return true;
}

inline std::string_view trim_ws(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_ws(s[b])) ++b;
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline bool is_blank(std::string_view s) {
  return trim_ws(s).empty();
}

// Collapse every whitespace run to one space and drop leading/trailing whitespace.
inline std::string collapse_ws(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  const char* p = s.data();
  const char* end = p + s.size();
  std::string_view tok;
  while (next_token(p, end, tok)) {
    if (!out.empty()) out.push_back(' ');
    out.append(tok.data(), tok.size());
  }
  return out;
}

template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Full-token double parse. Accepts a leading '+' (common in fixed-width line lists),
// which std::from_chars rejects on its own.
inline bool parse_double(std::string_view tok, double& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Parse the k-th whitespace-delimited column of `line` as a double.
inline bool parse_column_double(std::string_view line, std::size_t column, double& value) {
  const char* p = line.data();
  const char* end = p + line.size();
  std::string_view tok;
  for (std::size_t c = 0; c <= column; ++c) {
    if (!next_token(p, end, tok)) return false;
  }
  return parse_double(tok, value);
}

// Strict UTF-8 well-formedness check (no overlongs, no surrogates, max U+10FFFF).
inline bool is_valid_utf8(std::string_view s) {
  const auto* p = reinterpret_cast<const unsigned char*>(s.data());
  const auto* end = p + s.size();
  while (p < end) {
    const unsigned char c = *p;
    if (c < 0x80) {
      ++p;
      continue;
    }
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;
    if (static_cast<std::size_t>(end - p) < len) return false;
    for (std::size_t k = 1; k < len; ++k) {
      if ((p[k] & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (p[k] & 0x3F);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    p += len;
  }
  return true;
}

} // namespace linetrim
