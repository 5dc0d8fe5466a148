#include "linetrim/app/Runner.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "linetrim/output/Combiner.hpp"
#include "linetrim/output/TrimSummary.hpp"
#include "linetrim/query/LineQuery.hpp"
#include "linetrim/trim/WindowExtractor.hpp"
#include "linetrim/util/Log.hpp"
#include "linetrim/util/Timer.hpp"

#ifndef LINETRIM_VERSION_STR
#define LINETRIM_VERSION_STR "unknown"
#endif

namespace fs = std::filesystem;

namespace linetrim {

namespace {

fs::path under(const fs::path& root, const fs::path& p) {
  if (p.empty() || p.is_absolute()) return p;
  return (root / p).lexically_normal();
}

std::string fmt_seconds(double s) {
  std::ostringstream oss;
  oss << std::setprecision(6) << s;
  return oss.str();
}

} // namespace

RunPlan RunPlan::from_config(const IniConfig& cfg) {
  cfg.require_known_keys("input", {"linelist_dir"});
  cfg.require_known_keys("output", {"trimmed_dir", "summary_json"});
  cfg.require_known_keys("segments", {"begins", "ends"});
  cfg.require_known_keys("trim", {"include_molecules", "include_hydrogen", "per_segment", "strict"});
  cfg.require_known_keys("run", {"threads", "profile", "log_level"});
  cfg.require_known_keys("combine", {"enabled", "combined_name"});
  cfg.require_known_keys("query", {"enabled", "min_wavelength", "max_wavelength", "loggf_min", "species", "output"});

  RunPlan p;
  p.input_dir = cfg.get_path("input", "linelist_dir");
  p.trimmed_dir = cfg.get_path("output", "trimmed_dir");
  if (p.input_dir.empty()) throw std::runtime_error("[input] linelist_dir must not be empty");
  if (p.trimmed_dir.empty()) throw std::runtime_error("[output] trimmed_dir must not be empty");
  p.summary_json = under(p.trimmed_dir,
                         fs::path(cfg.get_string("output", "summary_json", std::optional<std::string>("trim_summary.json"))));

  p.segments = SegmentSet::from_bounds(cfg.get_double_list("segments", "begins"),
                                       cfg.get_double_list("segments", "ends"));

  p.trim.include_molecules = cfg.get_bool("trim", "include_molecules", std::optional<bool>(true));
  p.trim.include_hydrogen = cfg.get_bool("trim", "include_hydrogen", std::optional<bool>(true));
  p.trim.per_segment = cfg.get_bool("trim", "per_segment", std::optional<bool>(false));
  p.trim.strict = cfg.get_bool("trim", "strict", std::optional<bool>(false));
  p.trim.threads = static_cast<int>(cfg.get_int64("run", "threads", std::optional<std::int64_t>(1)));
  p.profile = cfg.get_bool("run", "profile", std::optional<bool>(true));

  p.combine = cfg.get_bool("combine", "enabled", std::optional<bool>(false));
  p.combined_name = cfg.get_string("combine", "combined_name", std::optional<std::string>(output::DEFAULT_COMBINED_NAME));
  if (p.combined_name.empty() || p.combined_name.find('/') != std::string::npos) {
    throw std::runtime_error("[combine] combined_name must be a plain file name");
  }

  p.query = cfg.get_bool("query", "enabled", std::optional<bool>(false));
  p.query_min = cfg.get_double("query", "min_wavelength", std::optional<double>(p.segments.envelope_min()));
  p.query_max = cfg.get_double("query", "max_wavelength", std::optional<double>(p.segments.envelope_max()));
  p.loggf_min = cfg.get_double("query", "loggf_min", std::optional<double>(-1.0));
  p.species = cfg.get_string("query", "species", std::optional<std::string>(""));
  p.query_output = under(p.trimmed_dir,
                         fs::path(cfg.get_string("query", "output", std::optional<std::string>("query_lines.tsv"))));
  if (p.query && !p.combine) {
    throw std::runtime_error("[query] enabled=true requires [combine] enabled=true");
  }
  if (p.query && p.query_min > p.query_max) {
    throw std::runtime_error("[query] min_wavelength must be <= max_wavelength");
  }
  return p;
}

Runner::Runner(const IniConfig& cfg, std::optional<int> threads_override)
: plan_(RunPlan::from_config(cfg)) {
  log::set_level(log::parse_level(cfg.get_string("run", "log_level", std::optional<std::string>("info"))));
  if (threads_override) plan_.trim.threads = *threads_override;
}

int Runner::validate_config() {
  WindowExtractor extractor(plan_.segments, plan_.trim);
  extractor.check_roots(plan_.input_dir, plan_.trimmed_dir);
  std::size_t skipped = 0;
  const auto files = WindowExtractor::list_linelist_files(plan_.input_dir, &skipped);

  std::cerr << "[linetrim] validation OK (no files written)\n"
            << "  input_dir: " << plan_.input_dir.string() << " (" << files.size() << " file(s), "
            << skipped << " metadata file(s) ignored)\n"
            << "  trimmed_dir: " << plan_.trimmed_dir.string() << "\n"
            << "  segments: " << plan_.segments.size() << " envelope=[" << plan_.segments.envelope_min()
            << ", " << plan_.segments.envelope_max() << "]\n"
            << "  layout: " << (plan_.trim.per_segment ? "per_segment" : "merged")
            << " groups=" << extractor.group_keys().size() << "\n";
  return 0;
}

int Runner::run() {
  WallTimer total_timer;
  double t_extract = 0.0;
  double t_combine = 0.0;
  double t_query = 0.0;

  WindowExtractor extractor(plan_.segments, plan_.trim);
  log::info("trimming " + plan_.input_dir.string() + " -> " + plan_.trimmed_dir.string() + " (" +
            std::to_string(plan_.segments.size()) + " segment(s), " +
            (plan_.trim.per_segment ? "per-segment" : "merged") + " layout)");

  TrimReport report;
  {
    ScopedTimer t(&t_extract);
    report = extractor.run(plan_.input_dir, plan_.trimmed_dir);
  }
  for (const auto& w : report.warnings) log::warn(w);
  log::info("processed " + std::to_string(report.files.size()) + " file(s), matched " +
            std::to_string(report.total_matched_lines()) + " line(s)");

  if (!plan_.summary_json.empty()) {
    output::TrimSummary sm;
    sm.linetrim_version = LINETRIM_VERSION_STR;
    sm.input_dir = plan_.input_dir.string();
    sm.options = plan_.trim;
    sm.segments.assign(plan_.segments.begin(), plan_.segments.end());
    sm.envelope_min = plan_.segments.envelope_min();
    sm.envelope_max = plan_.segments.envelope_max();
    sm.report = report;
    output::write_trim_summary(plan_.summary_json, sm);
  }

  output::CombineResult combined;
  if (plan_.combine) {
    ScopedTimer t(&t_combine);
    output::CombineOptions co;
    co.combined_name = plan_.combined_name;
    co.return_text = plan_.query;
    combined = output::combine_linelists(plan_.trimmed_dir, co);
    log::info("combined " + std::to_string(combined.sources_merged()) + " file(s) into " +
              std::to_string(combined.groups.size()) + " group document(s)");
  }

  if (plan_.query) {
    ScopedTimer t(&t_query);
    std::vector<query::FlatRecord> records;
    for (const auto& g : combined.groups) {
      auto part = query::parse_flat_records(g.text);
      records.insert(records.end(), part.begin(), part.end());
    }
    auto selected = query::filter_lines(records, plan_.query_min, plan_.query_max, plan_.loggf_min);
    if (!plan_.species.empty()) selected = query::find_species(selected, plan_.species);
    query::write_query_table(plan_.query_output, selected);
    log::info("query selected " + std::to_string(selected.size()) + " of " + std::to_string(records.size()) +
              " line(s) -> " + plan_.query_output.string());
  }

  const bool faults = report.files_with_faults() > 0;
  if (plan_.profile) {
    std::cerr << "[linetrim] profiling\n";
    std::cerr << "  wall: " << log::format_duration_ms(total_timer.elapsed_ms()) << "\n";
    std::cerr << "  extract_seconds: " << fmt_seconds(t_extract) << "\n";
    if (plan_.combine) std::cerr << "  combine_seconds: " << fmt_seconds(t_combine) << "\n";
    if (plan_.query) std::cerr << "  query_seconds: " << fmt_seconds(t_query) << "\n";
    if (!plan_.summary_json.empty()) std::cerr << "  summary_json: " << plan_.summary_json.string() << "\n";
  }
  return faults ? 2 : 0;
}

} // namespace linetrim
