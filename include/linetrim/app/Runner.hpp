#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "linetrim/config/IniConfig.hpp"
#include "linetrim/core/Segment.hpp"
#include "linetrim/trim/TrimOptions.hpp"

namespace linetrim {

// Everything the runner reads from the INI file, resolved and validated.
struct RunPlan {
  std::filesystem::path input_dir;
  std::filesystem::path trimmed_dir;
  std::filesystem::path summary_json;  // empty: disabled
  SegmentSet segments;
  TrimOptions trim;
  bool profile = true;

  bool combine = false;
  std::string combined_name;

  bool query = false;
  double query_min = 0.0;
  double query_max = 0.0;
  double loggf_min = -1.0;
  std::string species;                 // empty: no name lookup
  std::filesystem::path query_output;

  static RunPlan from_config(const IniConfig& cfg);
};

// main() handles CLI + config; Runner owns the pipeline:
// extract -> summary -> combine -> query.
class Runner {
public:
  explicit Runner(const IniConfig& cfg, std::optional<int> threads_override = std::nullopt);

  int run();

  // Resolve config and check input/output directories without touching disk.
  int validate_config();

  const RunPlan& plan() const { return plan_; }

private:
  RunPlan plan_;
};

} // namespace linetrim
