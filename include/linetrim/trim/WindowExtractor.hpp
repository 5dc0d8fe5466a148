#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "linetrim/core/Segment.hpp"
#include "linetrim/trim/TrimOptions.hpp"

namespace linetrim {

// Windowed extraction over a directory of line lists.
//
// run(input_root, output_root):
//   1) checks that input_root exists and output_root does not (TrimError MissingDirectory)
//   2) creates one group directory per output group ("0", or "0".."k-1" for per_segment)
//   3) classifies every regular file once and writes the lines falling inside the
//      segments to <output_root>/<group>/linelist-<seq>.bsyn
//
// Sequence numbers follow lexicographic path order, so output names do not depend on
// directory iteration order or on the thread count.
class WindowExtractor {
public:
  WindowExtractor(SegmentSet segments, TrimOptions opts);

  const SegmentSet& segments() const { return segs_; }
  const TrimOptions& options() const { return opts_; }

  // Group keys used for output directories.
  std::vector<int> group_keys() const;

  // Validation only (no side effects). Throws TrimError(MissingDirectory).
  void check_roots(const std::filesystem::path& input_root, const std::filesystem::path& output_root) const;

  TrimReport run(const std::filesystem::path& input_root, const std::filesystem::path& output_root) const;

  // One source file into existing group directories. File faults are recorded in
  // the report (and rethrown when strict). Exposed for tests.
  FileReport process_file(const std::filesystem::path& path, std::size_t seq,
                          const std::filesystem::path& output_root) const;

  // Regular files of `root` in lexicographic order, OS metadata files removed.
  static std::vector<std::filesystem::path> list_linelist_files(const std::filesystem::path& root,
                                                                std::size_t* skipped_metadata = nullptr);

private:
  SegmentSet segs_;
  TrimOptions opts_;

  void copy_hydrogen_(const std::filesystem::path& path, std::size_t seq,
                      const std::filesystem::path& output_root, FileReport& rep) const;
  void window_file_(const std::filesystem::path& path, std::size_t seq,
                    const std::filesystem::path& output_root, FileReport& rep) const;
};

} // namespace linetrim
