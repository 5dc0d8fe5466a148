#include "linetrim/query/LineQuery.hpp"

#include <algorithm>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>

#include "linetrim/core/TrimError.hpp"
#include "linetrim/util/AtomicFile.hpp"
#include "linetrim/util/Parse.hpp"

namespace linetrim::query {

namespace {

inline TrimError bad(std::size_t lineno, const std::string& msg) {
  return TrimError(TrimErrorKind::MalformedRecord, "combined line list, line " + std::to_string(lineno) + ": " + msg);
}

void erase_all(std::string& s, const std::string& what) {
  for (auto pos = s.find(what); pos != std::string::npos; pos = s.find(what, pos)) {
    s.erase(pos, what.size());
  }
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t nl = text.find('\n', start);
    const std::size_t stop = (nl == std::string_view::npos) ? text.size() : nl;
    std::size_t len = stop - start;
    if (len > 0 && text[start + len - 1] == '\r') --len;
    lines.push_back(text.substr(start, len));
    if (nl == std::string_view::npos) break;
    start = nl + 1;
  }
  return lines;
}

} // namespace

std::string normalize_species_name(std::string_view raw) {
  std::string s(raw);
  erase_all(s, "'");
  erase_all(s, "NLTE");
  erase_all(s, "LTE");
  return collapse_ws(s);
}

std::vector<FlatRecord> parse_flat_records(std::string_view text) {
  const auto lines = split_lines(text);
  std::vector<FlatRecord> out;
  std::vector<std::string_view> toks;

  std::size_t i = 0;
  while (i < lines.size()) {
    if (is_blank(lines[i])) {
      ++i;
      continue;
    }
    split_ws(lines[i], toks);
    if (toks.size() < 3) throw bad(i + 1, "element header has fewer than 3 tokens");

    std::string code(toks[0] == "'" ? toks[1] : toks[0]);
    erase_all(code, "'");
    int ion = 0;
    std::size_t count = 0;
    if (!parse_int(toks[toks.size() - 2], ion)) throw bad(i + 1, "invalid ionization '" + std::string(toks[toks.size() - 2]) + "'");
    if (!parse_int(toks.back(), count)) throw bad(i + 1, "invalid line count '" + std::string(toks.back()) + "'");
    if (i + 1 >= lines.size()) throw bad(i + 1, "missing species name line");
    if (i + 2 + count > lines.size()) {
      throw bad(i + 1, "element declares " + std::to_string(count) + " lines but the text ends early");
    }

    const std::string name = normalize_species_name(lines[i + 1]);
    for (std::size_t k = 0; k < count; ++k) {
      const std::size_t li = i + 2 + k;
      FlatRecord r;
      if (!parse_column_double(lines[li], 0, r.wavelength)) throw bad(li + 1, "invalid wavelength");
      if (!parse_column_double(lines[li], 2, r.loggf)) throw bad(li + 1, "invalid loggf (column 3)");
      r.species_name = name;
      r.species_code = code;
      r.ionization = ion;
      out.push_back(std::move(r));
    }
    i += 2 + count;
  }
  return out;
}

std::vector<FlatRecord> filter_lines(const std::vector<FlatRecord>& records, double lo, double hi, double loggf_min) {
  std::vector<FlatRecord> out;
  for (const auto& r : records) {
    if (lo <= r.wavelength && r.wavelength <= hi && r.loggf >= loggf_min) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const FlatRecord& a, const FlatRecord& b) { return a.wavelength < b.wavelength; });
  return out;
}

std::vector<FlatRecord> find_species(const std::vector<FlatRecord>& records, std::string_view name) {
  const std::string want = collapse_ws(name);
  std::vector<FlatRecord> out;
  for (const auto& r : records) {
    if (r.species_name == want) out.push_back(r);
  }
  return out;
}

void write_query_table(const std::filesystem::path& path, const std::vector<FlatRecord>& records) {
  util::atomic_write_text(path, [&](std::ostream& os) {
    os << "# wavelength\tspecies\tloggf\n";
    os << std::setprecision(12);
    for (const auto& r : records) {
      os << r.wavelength << '\t' << r.species_name << '\t' << r.loggf << '\n';
    }
  });
}

} // namespace linetrim::query
