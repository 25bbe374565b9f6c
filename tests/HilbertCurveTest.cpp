#include "../include/hilbert_curve.h"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

using namespace hilbert;

void test_depth_zero_single_cell() {
  TraversalOrder order = traversal_order(0);
  assert(order.size() == 1);
  assert(order[0].index == 0);
  assert(order[0].coord == (Coordinate{0, 0}));

  std::cout << "[PASS] test_depth_zero_single_cell\n";
}

void test_depth_one_path() {
  auto coords = generate(1);
  assert(coords.size() == 4);
  assert(coords[0] == (Coordinate{0, 0}));
  assert(coords[1] == (Coordinate{1, 0}));
  assert(coords[2] == (Coordinate{1, 1}));
  assert(coords[3] == (Coordinate{0, 1}));

  std::cout << "[PASS] test_depth_one_path\n";
}

void test_coverage() {
  for (int depth = 0; depth <= 6; ++depth) {
    const int side = 1 << depth;
    auto coords = generate(depth);
    assert(coords.size() == static_cast<size_t>(side) * side);

    std::set<std::pair<int, int>> seen;
    for (const auto &c : coords) {
      assert(c.row >= 0 && c.row < side);
      assert(c.col >= 0 && c.col < side);
      seen.insert({c.row, c.col});
    }
    // no duplicates, no omissions
    assert(seen.size() == coords.size());
  }

  std::cout << "[PASS] test_coverage\n";
}

void test_adjacency() {
  for (int depth = 1; depth <= 6; ++depth) {
    auto coords = generate(depth);
    for (size_t k = 1; k < coords.size(); ++k) {
      int dist = std::abs(coords[k].row - coords[k - 1].row) +
                 std::abs(coords[k].col - coords[k - 1].col);
      assert(dist == 1);
    }
  }

  std::cout << "[PASS] test_adjacency\n";
}

void test_endpoints() {
  // Starts at the origin and ends in the opposite corner of the first row.
  for (int depth = 1; depth <= 5; ++depth) {
    auto coords = generate(depth);
    assert(coords.front() == (Coordinate{0, 0}));
    assert(coords.back() == (Coordinate{0, (1 << depth) - 1}));
  }

  std::cout << "[PASS] test_endpoints\n";
}

void test_indices_sequential() {
  TraversalOrder order = traversal_order(4);
  for (size_t t = 0; t < order.size(); ++t) {
    assert(order[t].index == t);
  }

  std::cout << "[PASS] test_indices_sequential\n";
}

void test_deterministic() {
  TraversalOrder a = traversal_order(5);
  TraversalOrder b = traversal_order(5);
  assert(a.size() == b.size());
  for (size_t t = 0; t < a.size(); ++t) {
    assert(a[t].index == b[t].index);
    assert(a[t].coord == b[t].coord);
  }

  std::cout << "[PASS] test_deterministic\n";
}

void test_lazy_matches_eager() {
  for (int depth = 0; depth <= 5; ++depth) {
    TraversalOrder eager = traversal_order(depth);
    HilbertCursor cursor(depth);
    size_t count = 0;
    while (auto e = cursor.next()) {
      assert(count < eager.size());
      assert(e->index == eager[count].index);
      assert(e->coord == eager[count].coord);
      ++count;
    }
    assert(count == eager.size());
  }

  std::cout << "[PASS] test_lazy_matches_eager\n";
}

void test_cursor_budget() {
  HilbertCursor cursor(2);
  assert(cursor.side() == 4);
  assert(cursor.remaining() == 17);

  for (int k = 0; k < 16; ++k) {
    assert(cursor.next().has_value());
  }
  assert(cursor.remaining() == 1);
  assert(!cursor.next().has_value());
  assert(cursor.remaining() == 0);

  std::cout << "[PASS] test_cursor_budget\n";
}

void test_cursor_exhausted_throws() {
  HilbertCursor cursor(0);
  assert(cursor.next().has_value());
  assert(!cursor.next().has_value());

  bool threw = false;
  try {
    cursor.next();
  } catch (const std::out_of_range &) {
    threw = true;
  }
  assert(threw);

  std::cout << "[PASS] test_cursor_exhausted_throws\n";
}

void test_invalid_depth_throws() {
  bool threw = false;
  try {
    HilbertCursor cursor(-1);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    generate(16);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "[PASS] test_invalid_depth_throws\n";
}

void test_floor_log2() {
  assert(floor_log2(1) == 0);
  assert(floor_log2(2) == 1);
  assert(floor_log2(4) == 2);
  assert(floor_log2(256) == 8);
  // truncates silently
  assert(floor_log2(6) == 2);
  assert(floor_log2(1023) == 9);

  bool threw = false;
  try {
    floor_log2(0);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "[PASS] test_floor_log2\n";
}

void test_depth_for_side() {
  assert(depth_for_side(1) == 0);
  assert(depth_for_side(4) == 2);
  assert(depth_for_side(2048) == 11);

  const int rejected[] = {0, -4, 3, 6, 100};
  for (int n : rejected) {
    bool threw = false;
    try {
      depth_for_side(n);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "[PASS] test_depth_for_side\n";
}

int main() {
  std::cout << "=== Hilbert Curve Tests ===\n";

  test_depth_zero_single_cell();
  test_depth_one_path();
  test_coverage();
  test_adjacency();
  test_endpoints();
  test_indices_sequential();
  test_deterministic();

  // Lazy cursor
  test_lazy_matches_eager();
  test_cursor_budget();
  test_cursor_exhausted_throws();
  test_invalid_depth_throws();

  // Depth derivation
  test_floor_log2();
  test_depth_for_side();

  std::cout << "\n=== All 13 tests passed! ===\n";
  return 0;
}
