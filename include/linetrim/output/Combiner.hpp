#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace linetrim::output {

inline constexpr const char* DEFAULT_COMBINED_NAME = "combined_linelist.bsyn";

struct CombineOptions {
  std::string combined_name = DEFAULT_COMBINED_NAME;
  bool return_text = false;
};

struct CombinedGroup {
  std::string group;                 // subdirectory name
  std::filesystem::path path;        // combined document
  std::size_t sources_merged = 0;    // per-file documents consumed by this call
  std::string text;                  // full combined document (only with return_text)
};

struct CombineResult {
  std::vector<CombinedGroup> groups; // sorted by subdirectory name
  std::size_t sources_merged() const {
    std::size_t n = 0;
    for (const auto& g : groups) n += g.sources_merged;
    return n;
  }
};

// Merge every per-file document (*.bsyn other than the combined name) of each
// subdirectory of `trimmed_root` into one combined document, in sequence-number
// order, then delete the sources. An existing combined document keeps its
// content and new sources are appended after it. Subdirectories without sources
// are not touched, so calling this twice is a no-op.
CombineResult combine_linelists(const std::filesystem::path& trimmed_root, const CombineOptions& opts = {});

} // namespace linetrim::output
