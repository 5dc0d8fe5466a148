#include "linetrim/output/Combiner.hpp"
#include "linetrim/core/TrimError.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using linetrim_test::read_file;
using linetrim_test::TempDir;
using linetrim_test::write_file;

namespace {

std::string doc(const std::string& tag) {
  return "'26.000 '  1\t1\n'" + tag + "'  LTE\n  5000.000  1.000 -1.000\n";
}

} // namespace

int main() {
  using namespace linetrim;
  using namespace linetrim::output;

  // Sources are merged in numeric sequence order (10 after 2) and deleted.
  {
    TempDir tmp("combine_order");
    const fs::path g0 = tmp / "0";
    write_file(g0 / "linelist-10.bsyn", doc("ten"));
    write_file(g0 / "linelist-2.bsyn", doc("two"));
    write_file(g0 / "linelist-0.bsyn", doc("zero"));
    write_file(g0 / "linelist-1.bsyn", doc("one"));
    write_file(g0 / "notes.txt", "keep me\n");
    write_file(tmp / "1/linelist-3.bsyn", "'22.000 '  1\t1\n'Ti I'  LTE\n  5001.000  1.0 -1.0"); // no trailing newline
    write_file(tmp / "1/linelist-7.bsyn", doc("seven"));

    CombineOptions opts;
    opts.return_text = true;
    const CombineResult res = combine_linelists(tmp.path(), opts);
    assert(res.groups.size() == 2);
    assert(res.groups[0].group == "0");
    assert(res.groups[0].sources_merged == 4);
    assert(res.sources_merged() == 6);

    const std::string expected0 = doc("zero") + doc("one") + doc("two") + doc("ten");
    assert(res.groups[0].text == expected0);
    assert(read_file(g0 / DEFAULT_COMBINED_NAME) == expected0);
    assert(!fs::exists(g0 / "linelist-0.bsyn"));
    assert(!fs::exists(g0 / "linelist-10.bsyn"));
    assert(fs::exists(g0 / "notes.txt"));

    // A source without a trailing newline still starts the next document on a new line.
    const std::string g1 = read_file(tmp / "1" / DEFAULT_COMBINED_NAME);
    assert(g1 == "'22.000 '  1\t1\n'Ti I'  LTE\n  5001.000  1.0 -1.0\n" + doc("seven"));

    // Second call: nothing to merge, documents unchanged.
    const CombineResult again = combine_linelists(tmp.path(), opts);
    assert(again.sources_merged() == 0);
    assert(again.groups.size() == 2);
    assert(again.groups[0].text == expected0);
    assert(read_file(g0 / DEFAULT_COMBINED_NAME) == expected0);

    // New sources are appended after the existing combined content.
    write_file(g0 / "linelist-11.bsyn", doc("eleven"));
    const CombineResult more = combine_linelists(tmp.path());
    assert(more.sources_merged() == 1);
    assert(more.groups.size() == 2);
    assert(more.groups[0].text.empty()); // return_text off
    assert(read_file(g0 / DEFAULT_COMBINED_NAME) == expected0 + doc("eleven"));
  }

  // Custom combined name; empty group folders are skipped.
  {
    TempDir tmp("combine_named");
    write_file(tmp / "0/linelist-0.bsyn", doc("zero"));
    fs::create_directories(tmp / "1");
    write_file(tmp / "stray.bsyn", doc("stray")); // not inside a group folder

    CombineOptions opts;
    opts.combined_name = "all.bsyn";
    const CombineResult res = combine_linelists(tmp.path(), opts);
    assert(res.groups.size() == 1);
    assert(read_file(tmp / "0/all.bsyn") == doc("zero"));
    assert(!fs::exists(tmp / "1/all.bsyn"));
    assert(fs::exists(tmp / "stray.bsyn"));
  }

  // Missing root.
  {
    TempDir tmp("combine_missing");
    try {
      combine_linelists(tmp / "nope");
      assert(false && "missing root accepted");
    } catch (const TrimError& e) {
      assert(e.kind() == TrimErrorKind::MissingDirectory);
    }

    CombineOptions bad;
    bad.combined_name.clear();
    EXPECT_THROWS(combine_linelists(tmp.path(), bad), std::runtime_error);
  }

  std::cout << "Combiner test passed.\n";
  return 0;
}
