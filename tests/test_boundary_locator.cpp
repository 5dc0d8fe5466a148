#include "linetrim/alg/search/BoundaryLocator.hpp"
#include "linetrim/alg/search/WavelengthCache.hpp"
#include "linetrim/core/TrimError.hpp"
#include "linetrim/io/LinelistText.hpp"

#include "test_support.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Plain array with a probe counter, standing in for the cache.
struct Values {
  std::vector<double> v;
  std::size_t probes = 0;
  double at(std::size_t i) {
    ++probes;
    return v.at(i);
  }
};

std::size_t lb(std::vector<double> v, double x) {
  Values a{std::move(v)};
  return linetrim::alg::search::left_bound(a, 0, a.v.size(), x);
}

std::size_t rb(std::vector<double> v, double x) {
  Values a{std::move(v)};
  return linetrim::alg::search::right_bound(a, 0, a.v.size(), x);
}

} // namespace

int main() {
  using namespace linetrim;
  using namespace linetrim::alg::search;

  const std::vector<double> A = {12, 20, 32, 40, 52};

  // Left bound: smallest index with A[i] >= x, one past the end above the last value.
  assert(lb(A, 5) == 0);
  assert(lb(A, 12) == 0);
  assert(lb(A, 13) == 1);
  assert(lb(A, 20) == 1);
  assert(lb(A, 21) == 2);
  assert(lb(A, 51) == 4);
  assert(lb(A, 52) == 4);
  assert(lb(A, 53) == 5);

  // Right bound: largest index with A[i] <= x.
  assert(rb(A, 5) == 0);
  assert(rb(A, 13) == 0);
  assert(rb(A, 20) == 1);
  assert(rb(A, 21) == 1);
  assert(rb(A, 51) == 3);
  assert(rb(A, 52) == 4);
  assert(rb(A, 53) == 4);

  // Single-element block.
  assert(lb({7}, 7) == 0);
  assert(lb({7}, 8) == 1);
  assert(rb({7}, 7) == 0);

  // Duplicate runs on the left edge resolve to the first occurrence.
  assert(lb({10, 20, 20, 20, 30}, 20) == 1);
  assert(lb({20, 20, 20, 30}, 20) == 0);
  assert(lb({10, 30, 30, 30}, 30) == 1);
  assert(lb({10, 20, 30, 30, 30, 30, 30, 30, 40}, 30) == 2);

  // Duplicate runs on the right edge are fully included.
  assert(rb({10, 10, 10, 20}, 10) == 2);
  assert(rb({5, 10, 10, 10, 20}, 10) == 3);
  assert(rb({5, 10, 10, 10}, 10) == 3);
  {
    Values a{{10, 10, 10, 20}};
    const auto r = locate_window(a, a.v.size(), Segment{5, 10});
    assert(r && r->start == 0 && r->stop == 3);
  }

  // Searches honor a nonzero low index.
  {
    Values a{{1, 2, 3, 4, 5, 6, 7, 8}};
    assert(left_bound(a, 3, 8, 2.0) == 3);
    assert(left_bound(a, 3, 8, 6.0) == 5);
    assert(right_bound(a, 3, 8, 6.5) == 5);
    assert(right_bound(a, 5, 8, 100.0) == 7);
  }

  // Window location: inside, straddling, gap between lines, outside.
  {
    Values a{A};
    auto r = locate_window(a, 5, Segment{13, 41});
    assert(r && r->start == 1 && r->stop == 4 && r->size() == 3);
    r = locate_window(a, 5, Segment{0, 100});
    assert(r && r->start == 0 && r->stop == 5);
    r = locate_window(a, 5, Segment{21, 31});
    assert(!r);
    r = locate_window(a, 5, Segment{53, 60});
    assert(!r);
    r = locate_window(a, 5, Segment{0, 11});
    assert(!r);
    r = locate_window(a, 5, Segment{52, 52});
    assert(r && r->start == 4 && r->stop == 5);
  }

  // Cache-backed search parses only the probed lines.
  {
    std::ostringstream oss;
    oss << "header 1\nheader 2\n";
    for (int i = 0; i < 1000; ++i) {
      oss << "  " << (1000 + i) << ".000  3.5 -1.25  8.0\n";
    }
    const auto text = LinelistText::from_string(oss.str());
    WavelengthCache cache(text, 2, 1000);
    assert(cache.front() == 1000.0);
    assert(cache.back() == 1999.0);

    const auto r = locate_window(cache, 1000, Segment{1200.5, 1300.5});
    assert(r && r->start == 201 && r->stop == 301);
    assert(cache.parsed() < 50);

    const std::size_t before = cache.parsed();
    (void)locate_window(cache, 1000, Segment{1200.5, 1300.5});
    assert(cache.parsed() == before);

    cache.bind(text, 2, 10);
    assert(cache.parsed() == 0);
    assert(cache.back() == 1009.0);
  }

  // A data line without a numeric wavelength is a record fault.
  {
    const auto text = LinelistText::from_string("5000.0 1 -1\nnot-a-number 1 -1\n");
    WavelengthCache cache(text, 0, 2);
    bool threw = false;
    try {
      (void)cache.back();
    } catch (const TrimError& e) {
      threw = (e.kind() == TrimErrorKind::MalformedRecord);
    }
    assert(threw);
  }

  std::cout << "BoundaryLocator test passed.\n";
  return 0;
}
