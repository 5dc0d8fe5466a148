#include "linetrim/trim/WindowExtractor.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#if LINETRIM_HAS_OPENMP
#include <omp.h>
#endif

#include "linetrim/alg/search/BoundaryLocator.hpp"
#include "linetrim/alg/search/WavelengthCache.hpp"
#include "linetrim/core/TrimError.hpp"
#include "linetrim/io/ElementBlockReader.hpp"
#include "linetrim/io/LinelistClassifier.hpp"
#include "linetrim/io/LinelistText.hpp"
#include "linetrim/output/LinelistWriter.hpp"
#include "linetrim/util/Log.hpp"

namespace fs = std::filesystem;

namespace linetrim {

namespace {

using alg::search::LineRange;

// Sort by start and merge overlapping/adjacent ranges. Only needed for the merged
// layout, where two overlapping segments can select the same lines.
void coalesce(std::vector<LineRange>& ranges) {
  if (ranges.size() < 2) return;
  std::sort(ranges.begin(), ranges.end(),
            [](const LineRange& a, const LineRange& b) { return a.start < b.start; });
  std::size_t w = 0;
  for (std::size_t i = 1; i < ranges.size(); ++i) {
    if (ranges[i].start <= ranges[w].stop) {
      ranges[w].stop = std::max(ranges[w].stop, ranges[i].stop);
    } else {
      ranges[++w] = ranges[i];
    }
  }
  ranges.resize(w + 1);
}

} // namespace

WindowExtractor::WindowExtractor(SegmentSet segments, TrimOptions opts)
: segs_(std::move(segments)), opts_(opts) {
  if (segs_.empty()) {
    throw std::runtime_error("WindowExtractor: no segments given");
  }
}

std::vector<int> WindowExtractor::group_keys() const {
  std::vector<int> keys;
  if (!opts_.per_segment) {
    keys.push_back(0);
    return keys;
  }
  keys.reserve(segs_.size());
  for (std::size_t i = 0; i < segs_.size(); ++i) keys.push_back(static_cast<int>(i));
  return keys;
}

void WindowExtractor::check_roots(const fs::path& input_root, const fs::path& output_root) const {
  std::error_code ec;
  if (!fs::is_directory(input_root, ec)) {
    throw TrimError(TrimErrorKind::MissingDirectory, "line list directory does not exist: " + input_root.string());
  }
  if (fs::exists(output_root, ec)) {
    throw TrimError(TrimErrorKind::MissingDirectory,
                    "output directory already exists (refusing to mix runs): " + output_root.string());
  }
}

std::vector<fs::path> WindowExtractor::list_linelist_files(const fs::path& root, std::size_t* skipped_metadata) {
  std::vector<fs::path> files;
  std::size_t skipped = 0;
  for (const auto& entry : fs::directory_iterator(root)) {
    if (!entry.is_regular_file()) continue;
    if (is_os_metadata_file(entry.path())) {
      log::debug("skipping OS metadata file " + entry.path().string());
      ++skipped;
      continue;
    }
    files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());
  if (skipped_metadata) *skipped_metadata = skipped;
  return files;
}

TrimReport WindowExtractor::run(const fs::path& input_root, const fs::path& output_root) const {
  check_roots(input_root, output_root);

  TrimReport report;
  report.groups = group_keys();
  for (int key : report.groups) {
    fs::create_directories(output::group_dir(output_root, key));
  }

  const auto files = list_linelist_files(input_root, &report.skipped_metadata);
  report.files.resize(files.size());

  const std::int64_t nfiles = static_cast<std::int64_t>(files.size());
  std::exception_ptr first_error;

#if LINETRIM_HAS_OPENMP
  const int nthreads = (opts_.threads > 0) ? opts_.threads : omp_get_max_threads();
  #pragma omp parallel for schedule(dynamic, 1) num_threads(nthreads)
#endif
  for (std::int64_t i = 0; i < nfiles; ++i) {
    const std::size_t seq = static_cast<std::size_t>(i);
    try {
      report.files[seq] = process_file(files[seq], seq, output_root);
    } catch (...) {
#if LINETRIM_HAS_OPENMP
      #pragma omp critical(linetrim_first_error)
#endif
      {
        if (!first_error) first_error = std::current_exception();
      }
    }
  }
  if (first_error) std::rethrow_exception(first_error);

  for (const auto& f : report.files) {
    if (f.cls == FileClass::Unreadable || f.cls == FileClass::Empty) {
      report.warnings.push_back("file " + f.path + " skipped (" + file_class_name(f.cls) + "): " + f.message);
    }
    if (f.fault_kind) {
      report.warnings.push_back("file " + f.path + " aborted (" + trim_error_kind_name(*f.fault_kind) + "): " + f.fault);
    }
  }
  return report;
}

FileReport WindowExtractor::process_file(const fs::path& path, std::size_t seq, const fs::path& output_root) const {
  FileReport rep;
  rep.path = path.string();
  rep.seq = seq;

  const FileClassification fc = classify_linelist_file(path, opts_.classify_flags());
  rep.cls = fc.cls;
  rep.message = fc.message;
  if (fc.species) rep.species = fc.species->dotted();
  log::debug("file " + rep.path + " classified as " + file_class_name(fc.cls) +
             (rep.species.empty() ? std::string() : " (" + rep.species + ")"));

  if (!fc.kept()) return rep;

  if (fc.cls == FileClass::Hydrogen) {
    copy_hydrogen_(path, seq, output_root, rep);
    return rep;
  }

  try {
    window_file_(path, seq, output_root, rep);
  } catch (const TrimError& e) {
    if (e.kind() == TrimErrorKind::IOUnreadable) {
      rep.cls = FileClass::Unreadable;
      rep.message = e.what();
      return rep;
    }
    if (!e.is_file_fault() || opts_.strict) throw;
    rep.fault_kind = e.kind();
    rep.fault = e.what();
  }
  return rep;
}

void WindowExtractor::copy_hydrogen_(const fs::path& path, std::size_t seq, const fs::path& output_root,
                                     FileReport& rep) const {
  for (int key : group_keys()) {
    const fs::path dest = output::group_dir(output_root, key) / output::destination_name(seq);
    std::error_code ec;
    fs::copy_file(path, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      throw std::runtime_error("failed to copy hydrogen line list '" + path.string() + "' -> '" + dest.string() +
                               "' (" + ec.message() + ")");
    }
  }
  rep.copied_verbatim = true;
}

void WindowExtractor::window_file_(const fs::path& path, std::size_t seq, const fs::path& output_root,
                                   FileReport& rep) const {
  LinelistText text;
  try {
    text = LinelistText::load(path);
  } catch (const std::runtime_error& e) {
    throw TrimError(TrimErrorKind::IOUnreadable, e.what());
  }

  ElementBlockReader reader(text, path.filename().string());
  output::GroupFileWriter writer(output_root, seq);
  alg::search::WavelengthCache cache;
  std::map<int, std::vector<LineRange>> matches;

  ElementBlock block;
  while (reader.next(block)) {
    ++rep.blocks;
    const std::size_t n = block.declared_lines;
    if (n == 0) continue;

    cache.bind(text, block.first_data_line, n);
    if (segs_.outside_envelope(cache.front(), cache.back())) {
      ++rep.blocks_outside;
      continue;
    }

    for (std::size_t si = 0; si < segs_.size(); ++si) {
      const auto r = alg::search::locate_window(cache, n, segs_[si]);
      if (!r) continue;
      const int key = opts_.per_segment ? static_cast<int>(si) : 0;
      matches[key].push_back({r->start + block.first_data_line, r->stop + block.first_data_line});
    }
    if (matches.empty()) continue;

    for (auto& [key, ranges] : matches) {
      if (!opts_.per_segment) coalesce(ranges);
      rep.lines_per_group[key] += writer.write_block(key, block, ranges, text);
    }
    ++rep.blocks_written;
    matches.clear();
  }
  writer.close();
}

} // namespace linetrim
