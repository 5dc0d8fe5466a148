#include "linetrim/output/Combiner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "linetrim/core/TrimError.hpp"
#include "linetrim/output/LinelistWriter.hpp"
#include "linetrim/util/AtomicFile.hpp"
#include "linetrim/util/Log.hpp"
#include "linetrim/util/Parse.hpp"

namespace fs = std::filesystem;

namespace linetrim::output {

namespace {

// "linelist-<seq>.bsyn" -> seq; other names sort after all numbered ones.
struct SourceKey {
  bool numbered = false;
  std::size_t seq = 0;
  std::string name;

  bool operator<(const SourceKey& o) const {
    if (numbered != o.numbered) return numbered;
    if (numbered && seq != o.seq) return seq < o.seq;
    return name < o.name;
  }
};

SourceKey source_key(const fs::path& p) {
  SourceKey k;
  k.name = p.filename().string();
  const std::string prefix = "linelist-";
  const std::string suffix = LINELIST_SUFFIX;
  if (k.name.size() > prefix.size() + suffix.size() && k.name.rfind(prefix, 0) == 0) {
    const std::string_view digits(k.name.data() + prefix.size(), k.name.size() - prefix.size() - suffix.size());
    k.numbered = parse_int(digits, k.seq);
  }
  return k;
}

bool has_suffix(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

CombineResult combine_linelists(const fs::path& trimmed_root, const CombineOptions& opts) {
  std::error_code ec;
  if (!fs::is_directory(trimmed_root, ec)) {
    throw TrimError(TrimErrorKind::MissingDirectory, "trimmed directory does not exist: " + trimmed_root.string());
  }
  if (opts.combined_name.empty()) {
    throw std::runtime_error("combine: combined document name is empty");
  }

  std::vector<fs::path> folders;
  for (const auto& entry : fs::directory_iterator(trimmed_root)) {
    if (entry.is_directory()) folders.push_back(entry.path());
  }
  std::sort(folders.begin(), folders.end());

  CombineResult result;
  for (const auto& folder : folders) {
    std::vector<std::pair<SourceKey, fs::path>> sources;
    for (const auto& entry : fs::directory_iterator(folder)) {
      if (!entry.is_regular_file()) continue;
      const std::string name = entry.path().filename().string();
      if (name == opts.combined_name || !has_suffix(name, LINELIST_SUFFIX)) continue;
      sources.emplace_back(source_key(entry.path()), entry.path());
    }
    std::sort(sources.begin(), sources.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    CombinedGroup g;
    g.group = folder.filename().string();
    g.path = folder / opts.combined_name;
    g.sources_merged = sources.size();

    const bool have_combined = fs::exists(g.path, ec);
    if (sources.empty()) {
      if (!have_combined) continue;
      if (opts.return_text) g.text = util::read_file_bytes(g.path);
      result.groups.push_back(std::move(g));
      continue;
    }

    std::string merged = have_combined ? util::read_file_bytes(g.path) : std::string();
    for (const auto& [key, src] : sources) {
      std::string doc = util::read_file_bytes(src);
      if (!merged.empty() && merged.back() != '\n') merged.push_back('\n');
      merged += doc;
    }
    util::atomic_write_text(g.path, [&](std::ostream& os) { os << merged; });

    for (const auto& [key, src] : sources) {
      fs::remove(src, ec);
      if (ec) {
        throw std::runtime_error("combine: failed to remove merged source '" + src.string() + "' (" + ec.message() + ")");
      }
    }
    log::debug("combined " + std::to_string(sources.size()) + " file(s) into " + g.path.string());
    if (opts.return_text) g.text = std::move(merged);
    result.groups.push_back(std::move(g));
  }
  return result;
}

} // namespace linetrim::output
