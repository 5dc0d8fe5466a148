#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "linetrim/core/TrimError.hpp"
#include "linetrim/io/LinelistClassifier.hpp"

namespace linetrim {

struct TrimOptions {
  bool include_molecules = true;
  bool include_hydrogen = true;
  bool per_segment = false; // lbl layout: one output group per sorted segment
  bool strict = false;      // malformed files abort the whole run
  int threads = 1;          // OpenMP workers over input files (<= 0: runtime default)

  ClassifyFlags classify_flags() const { return {include_molecules, include_hydrogen}; }
};

// Outcome for one input line list.
struct FileReport {
  std::string path;
  std::size_t seq = 0;
  FileClass cls = FileClass::Unreadable;
  std::string species;                 // dotted identifier from the first line, if parsed
  std::string message;                 // classification note (skip reason)
  std::size_t blocks = 0;              // element blocks walked
  std::size_t blocks_outside = 0;      // rejected by the segment envelope
  std::size_t blocks_written = 0;      // blocks with at least one matched line
  std::map<int, std::size_t> lines_per_group;
  bool copied_verbatim = false;        // hydrogen fast path
  std::optional<TrimErrorKind> fault_kind;
  std::string fault;

  std::size_t matched_lines() const {
    std::size_t n = 0;
    for (const auto& kv : lines_per_group) n += kv.second;
    return n;
  }
};

struct TrimReport {
  std::vector<int> groups;
  std::vector<FileReport> files; // in sequence order
  std::vector<std::string> warnings;
  std::size_t skipped_metadata = 0;

  std::size_t files_with_faults() const {
    std::size_t n = 0;
    for (const auto& f : files) n += f.fault_kind ? 1 : 0;
    return n;
  }
  std::size_t total_matched_lines() const {
    std::size_t n = 0;
    for (const auto& f : files) n += f.matched_lines();
    return n;
  }
};

} // namespace linetrim
