#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "linetrim/alg/search/BoundaryLocator.hpp"
#include "linetrim/core/ElementBlock.hpp"
#include "linetrim/io/LinelistText.hpp"

namespace linetrim::output {
namespace fs = std::filesystem;

inline constexpr const char* LINELIST_SUFFIX = ".bsyn";

inline std::string destination_name(std::size_t seq) {
  return "linelist-" + std::to_string(seq) + LINELIST_SUFFIX;
}

inline fs::path group_dir(const fs::path& root, int key) {
  return root / std::to_string(key);
}

// Append-mode destinations for ONE source line list: <root>/<group>/linelist-<seq>.bsyn.
// Streams are opened on the first block that reaches a group and closed when the
// writer goes out of scope, so no handle outlives the source file.
class GroupFileWriter {
public:
  GroupFileWriter(fs::path root, std::size_t seq) : root_(std::move(root)), seq_(seq) {}

  GroupFileWriter(const GroupFileWriter&) = delete;
  GroupFileWriter& operator=(const GroupFileWriter&) = delete;

  // Write one element: header 1 with the matched count, header 2 verbatim, then the
  // lines of `ranges` (absolute line indices into `text`, ascending, non-overlapping).
  // Returns the number of data lines written.
  std::size_t write_block(int key,
                          const ElementBlock& block,
                          const std::vector<alg::search::LineRange>& ranges,
                          const LinelistText& text) {
    std::size_t count = 0;
    for (const auto& r : ranges) count += r.size();

    std::ofstream& ofs = stream_(key);
    ofs << block.header_line_1 << '\t' << count << '\n';
    ofs << block.header_line_2 << '\n';
    for (const auto& r : ranges) {
      for (std::size_t i = r.start; i < r.stop; ++i) {
        const std::string_view line = text.line(i);
        ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
        ofs.put('\n');
      }
    }
    if (!ofs) throw std::runtime_error("GroupFileWriter: write failed: " + path_(key).string());
    return count;
  }

  void close() {
    for (auto& [key, ofs] : streams_) {
      ofs.flush();
      if (!ofs) throw std::runtime_error("GroupFileWriter: flush failed: " + path_(key).string());
      ofs.close();
    }
    streams_.clear();
  }

  std::size_t seq() const { return seq_; }

private:
  fs::path root_;
  std::size_t seq_ = 0;
  std::map<int, std::ofstream> streams_;

  fs::path path_(int key) const { return group_dir(root_, key) / destination_name(seq_); }

  std::ofstream& stream_(int key) {
    auto it = streams_.find(key);
    if (it != streams_.end()) return it->second;
    std::ofstream ofs(path_(key), std::ios::binary | std::ios::app);
    if (!ofs) throw std::runtime_error("GroupFileWriter: failed to open for append: " + path_(key).string());
    return streams_.emplace(key, std::move(ofs)).first->second;
  }
};

} // namespace linetrim::output
