#include "linetrim/util/Log.hpp"
#include "linetrim/util/Parse.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int main() {
  using namespace linetrim;

  // Whitespace splitting (tabs, CR, repeated blanks).
  {
    std::vector<std::string_view> toks;
    split_ws("  '   3.000            '    1\t13\r", toks);
    assert(toks.size() == 5);
    assert(toks[0] == "'");
    assert(toks[1] == "3.000");
    assert(toks[4] == "13");

    split_ws("   \t ", toks);
    assert(toks.empty());
  }

  // Full-token numeric parsing.
  {
    double v = 0.0;
    assert(parse_double("5000.125", v) && approx(v, 5000.125));
    assert(parse_double("+1.5", v) && approx(v, 1.5));
    assert(parse_double("-2.25e1", v) && approx(v, -22.5));
    assert(!parse_double("12abc", v));
    assert(!parse_double("", v));

    int i = 0;
    assert(parse_int("42", i) && i == 42);
    assert(!parse_int("4.2", i));
    std::size_t n = 0;
    assert(!parse_int("-3", n));
  }

  // Column access.
  {
    double v = 0.0;
    const std::string line = "  6103.538  1.848 -0.101  8.0";
    assert(parse_column_double(line, 0, v) && approx(v, 6103.538));
    assert(parse_column_double(line, 2, v) && approx(v, -0.101));
    assert(!parse_column_double(line, 9, v));
  }

  // Whitespace helpers.
  {
    assert(trim_ws("  Fe II \t") == "Fe II");
    assert(is_blank(" \t\r"));
    assert(collapse_ws("  Fe    II   ") == "Fe II");
    assert(collapse_ws("") == "");
  }

  // UTF-8 validity.
  {
    assert(is_valid_utf8("'  26.000  '  1  3"));
    assert(is_valid_utf8("\xC2\xB5m"));
    assert(!is_valid_utf8("\xFF\xFE"));
    assert(!is_valid_utf8("\xC0\xAF"));     // overlong
    assert(!is_valid_utf8("\xE2\x82"));     // truncated
    assert(!is_valid_utf8("\xED\xA0\x80")); // surrogate
  }

  // Log levels and duration formatting.
  {
    using namespace linetrim::log;
    assert(parse_level("DEBUG") == Level::Debug);
    assert(parse_level("") == Level::Info);
    assert(level_name(parse_level("warn")) == "quiet");
    EXPECT_THROWS(parse_level("loud"), std::runtime_error);

    set_level(Level::Quiet);
    assert(!enabled(Level::Info));
    set_level(Level::Debug);
    assert(enabled(Level::Info) && enabled(Level::Debug));
    set_level(Level::Info);

    assert(format_duration_ms(850) == "850 ms");
    assert(format_duration_ms(12340) == "12.3 s");
    assert(format_duration_ms(250000) == "4m 10s");
    assert(format_duration_ms(7500000) == "2h 5m 0s");
  }

  std::cout << "Parse test passed.\n";
  return 0;
}
