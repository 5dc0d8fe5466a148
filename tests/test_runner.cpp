#include "linetrim/app/Runner.hpp"
#include "linetrim/config/IniConfig.hpp"
#include "linetrim/core/TrimError.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using linetrim_test::read_file;
using linetrim_test::TempDir;
using linetrim_test::write_file;

namespace {

const std::string kFe =
    "'26.000              '    1        3\n"
    "'Fe I    '    LTE\n"
    "  4990.000  1.000 -1.000\n"
    "  5000.000  1.000  0.100\n"
    "  5030.000  1.000 -1.400\n"
    "'26.000              '    2        2\n"
    "'Fe II   '    NLTE\n"
    "  5001.000  2.000 -0.500\n"
    "  6100.000  2.000 -2.100\n";

const std::string kLi =
    "'   3.000            '    1        2\n"
    "'Li I    '    LTE\n"
    "  4995.000  1.848  0.582\n"
    "  6707.761  0.000 -0.002\n";

const std::string kHydrogen =
    "'01.000000           '    1        1\n"
    "'H I     '    LTE\n"
    "  4861.350  10.199 -0.020\n";

std::string base_config(const std::string& extra) {
  return "[input]\n"
         "linelist_dir = in\n"
         "[output]\n"
         "trimmed_dir = out\n"
         "[segments]\n"
         "begins = 4980\n"
         "ends = 5010\n"
         "[run]\n"
         "profile = false\n"
         "log_level = quiet\n" +
         extra;
}

} // namespace

int main() {
  using namespace linetrim;

  // Full pipeline: trim, summary, combine, query.
  {
    TempDir tmp("runner_full");
    write_file(tmp / "in/a_fe.bsyn", kFe);
    write_file(tmp / "in/b_li.bsyn", kLi);
    write_file(tmp / "in/c_h.bsyn", kHydrogen);
    write_file(tmp / "in/.DS_Store", "x");

    const auto cfg = IniConfig::from_string(base_config("[combine]\n"
                                                        "enabled = true\n"
                                                        "[query]\n"
                                                        "enabled = true\n"
                                                        "loggf_min = -0.6\n"),
                                            tmp.path());
    Runner runner(cfg);
    assert(runner.plan().input_dir == tmp / "in");
    assert(runner.plan().summary_json == tmp / "out/trim_summary.json");
    assert(runner.plan().query_min == 4980.0 && runner.plan().query_max == 5010.0);
    assert(runner.run() == 0);

    const std::string combined = read_file(tmp / "out/0/combined_linelist.bsyn");
    assert(combined ==
           "'26.000 '  1\t2\n'Fe I    '    LTE\n  4990.000  1.000 -1.000\n  5000.000  1.000  0.100\n"
           "'26.000 '  2\t1\n'Fe II   '    NLTE\n  5001.000  2.000 -0.500\n"
           "'   3.000            '    1\t1\n'Li I    '    LTE\n  4995.000  1.848  0.582\n" +
               kHydrogen);
    assert(!fs::exists(tmp / "out/0/linelist-0.bsyn"));

    assert(read_file(tmp / "out/query_lines.tsv") ==
           "# wavelength\tspecies\tloggf\n"
           "4995\tLi I\t0.582\n"
           "5000\tFe I\t0.1\n"
           "5001\tFe II\t-0.5\n");

    const std::string summary = read_file(tmp / "out/trim_summary.json");
    assert(summary.find("\"schema_version\": \"1.0\"") != std::string::npos);
    assert(summary.find("\"class\": \"hydrogen\"") != std::string::npos);
    assert(summary.find("\"skipped_metadata\": 1") != std::string::npos);
    assert(summary.find("\"matched_lines\": 4") != std::string::npos);

    // The output directory now exists: a second run refuses to mix.
    Runner again(cfg);
    EXPECT_THROWS(again.run(), TrimError);
    EXPECT_THROWS(again.validate_config(), TrimError);
  }

  // Species lookup narrows the query table.
  {
    TempDir tmp("runner_species");
    write_file(tmp / "in/a_fe.bsyn", kFe);
    const auto cfg = IniConfig::from_string(base_config("[combine]\n"
                                                        "enabled = yes\n"
                                                        "[query]\n"
                                                        "enabled = yes\n"
                                                        "species = \"Fe  II\"\n"
                                                        "output = fe2.tsv\n"),
                                            tmp.path());
    Runner runner(cfg);
    assert(runner.validate_config() == 0);
    assert(!fs::exists(tmp / "out"));
    assert(runner.run() == 0);
    assert(read_file(tmp / "out/fe2.tsv") == "# wavelength\tspecies\tloggf\n5001\tFe II\t-0.5\n");
  }

  // A malformed file is reported through the exit code; the other files are trimmed.
  {
    TempDir tmp("runner_fault");
    write_file(tmp / "in/a_fe.bsyn", kFe);
    write_file(tmp / "in/b_bad.bsyn", "'26.000              '    1        9\n'Fe I '  LTE\n  5000.0 1.0 -1.0\n");
    const auto cfg = IniConfig::from_string(base_config("[trim]\nper_segment = true\n"), tmp.path());
    Runner runner(cfg, 2);
    assert(runner.plan().trim.threads == 2);
    assert(runner.run() == 2);
    assert(fs::exists(tmp / "out/0/linelist-0.bsyn"));
    assert(read_file(tmp / "out/trim_summary.json").find("\"fault_kind\": \"malformed_header\"") !=
           std::string::npos);
  }

  // Config validation.
  {
    const fs::path base = "/data/run";
    EXPECT_THROWS(RunPlan::from_config(IniConfig::from_string(base_config("[query]\nenabled = true\n"), base)),
                  std::runtime_error);
    EXPECT_THROWS(RunPlan::from_config(IniConfig::from_string(base_config("[trim]\nper_segmnt = true\n"), base)),
                  std::runtime_error);
    EXPECT_THROWS(RunPlan::from_config(
                      IniConfig::from_string(base_config("[combine]\ncombined_name = a/b.bsyn\n"), base)),
                  std::runtime_error);
    EXPECT_THROWS(RunPlan::from_config(IniConfig::from_string(
                      "[input]\nlinelist_dir = in\n[output]\ntrimmed_dir = out\n"
                      "[segments]\nbegins = 5000, 6000\nends = 5100\n",
                      base)),
                  std::runtime_error);
    EXPECT_THROWS(RunPlan::from_config(IniConfig::from_string(
                      "[input]\nlinelist_dir = in\n[output]\ntrimmed_dir = out\n"
                      "[segments]\nbegins = 5100\nends = 5000\n",
                      base)),
                  std::runtime_error);

    const RunPlan p = RunPlan::from_config(
        IniConfig::from_string(base_config("[output]\nsummary_json = /tmp/elsewhere.json\n"), base));
    assert(p.summary_json == fs::path("/tmp/elsewhere.json"));
    assert(p.trimmed_dir == fs::path("/data/run/out"));
    assert(!p.combine && !p.query);
    assert(p.trim.include_molecules && p.trim.include_hydrogen && !p.trim.per_segment);
  }

  std::cout << "Runner test passed.\n";
  return 0;
}
