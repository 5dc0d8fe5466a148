#pragma once

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "linetrim/core/Segment.hpp"
#include "linetrim/trim/TrimOptions.hpp"
#include "linetrim/util/AtomicFile.hpp"

namespace linetrim::output {
namespace fs = std::filesystem;

// Bump when changing the JSON layout in non-backward-compatible ways.
inline constexpr const char* SUMMARY_SCHEMA_VERSION = "1.0";

// Run audit written next to the group directories. Holds no timestamps, timings
// or output paths: two runs over the same inputs produce the same bytes.
struct TrimSummary {
  std::string schema_version = SUMMARY_SCHEMA_VERSION;
  std::string linetrim_version;
  std::string input_dir;
  TrimOptions options;
  std::vector<Segment> segments; // sorted
  double envelope_min = 0.0;
  double envelope_max = 0.0;
  TrimReport report;
};

inline std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    switch (c) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (c < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c << std::dec;
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

inline void write_trim_summary(const fs::path& out_path, const TrimSummary& sm) {
  auto q = [&](const std::string& s) {
    return std::string("\"") + json_escape(s) + "\"";
  };
  auto b = [](bool v) { return v ? "true" : "false"; };

  util::atomic_write_text(out_path, [&](std::ostream& ofs) {
    const auto& rep = sm.report;
    ofs << std::setprecision(17);
    ofs << "{\n";
    ofs << "  \"schema_version\": " << q(sm.schema_version) << ",\n";
    ofs << "  \"linetrim_version\": " << q(sm.linetrim_version) << ",\n";
    ofs << "  \"run\": {\n";
    ofs << "    \"input_dir\": " << q(sm.input_dir) << ",\n";
    ofs << "    \"include_molecules\": " << b(sm.options.include_molecules) << ",\n";
    ofs << "    \"include_hydrogen\": " << b(sm.options.include_hydrogen) << ",\n";
    ofs << "    \"per_segment\": " << b(sm.options.per_segment) << ",\n";
    ofs << "    \"strict\": " << b(sm.options.strict) << "\n";
    ofs << "  },\n";

    ofs << "  \"segments\": [";
    for (std::size_t i = 0; i < sm.segments.size(); ++i) {
      ofs << (i ? ", " : "") << "[" << sm.segments[i].begin << ", " << sm.segments[i].end << "]";
    }
    ofs << "],\n";
    ofs << "  \"envelope\": [" << sm.envelope_min << ", " << sm.envelope_max << "],\n";

    ofs << "  \"groups\": [";
    for (std::size_t i = 0; i < rep.groups.size(); ++i) ofs << (i ? ", " : "") << rep.groups[i];
    ofs << "],\n";

    ofs << "  \"files\": [\n";
    for (std::size_t i = 0; i < rep.files.size(); ++i) {
      const auto& f = rep.files[i];
      ofs << "    {\n";
      ofs << "      \"seq\": " << f.seq << ",\n";
      ofs << "      \"path\": " << q(f.path) << ",\n";
      ofs << "      \"class\": " << q(file_class_name(f.cls)) << ",\n";
      ofs << "      \"species\": " << q(f.species) << ",\n";
      ofs << "      \"blocks\": " << f.blocks << ",\n";
      ofs << "      \"blocks_outside_envelope\": " << f.blocks_outside << ",\n";
      ofs << "      \"blocks_written\": " << f.blocks_written << ",\n";
      ofs << "      \"copied_verbatim\": " << b(f.copied_verbatim) << ",\n";
      ofs << "      \"lines_per_group\": {";
      std::size_t k = 0;
      for (const auto& [key, n] : f.lines_per_group) {
        ofs << (k++ ? ", " : "") << q(std::to_string(key)) << ": " << n;
      }
      ofs << "},\n";
      ofs << "      \"fault_kind\": " << (f.fault_kind ? q(trim_error_kind_name(*f.fault_kind)) : std::string("null")) << ",\n";
      ofs << "      \"fault\": " << q(f.fault) << "\n";
      ofs << "    }" << (i + 1 < rep.files.size() ? "," : "") << "\n";
    }
    ofs << "  ],\n";

    ofs << "  \"warnings\": [";
    for (std::size_t i = 0; i < rep.warnings.size(); ++i) ofs << (i ? ", " : "") << q(rep.warnings[i]);
    ofs << "],\n";

    ofs << "  \"totals\": {\n";
    ofs << "    \"files\": " << rep.files.size() << ",\n";
    ofs << "    \"skipped_metadata\": " << rep.skipped_metadata << ",\n";
    ofs << "    \"files_with_faults\": " << rep.files_with_faults() << ",\n";
    ofs << "    \"matched_lines\": " << rep.total_matched_lines() << "\n";
    ofs << "  }\n";
    ofs << "}\n";
  });
}

} // namespace linetrim::output
