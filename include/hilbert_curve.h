#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

// Discretized Hilbert curve over a 2^depth x 2^depth grid.
//
// The curve is produced by expanding the L-system start symbol H(depth)
// through a FIFO work queue. Curve symbols (H, A, B, C) rewrite into seven
// items one level down; move symbols are carried down unchanged and only
// move the cursor once they reach depth 0.
namespace hilbert {

struct Coordinate {
    int row;
    int col;
};

inline bool operator==(const Coordinate &a, const Coordinate &b) {
    return a.row == b.row && a.col == b.col;
}
inline bool operator!=(const Coordinate &a, const Coordinate &b) { return !(a == b); }

struct TraversalEntry {
    std::size_t index;
    Coordinate coord;
};

using TraversalOrder = std::vector<TraversalEntry>;

enum class Symbol : char {
    H, A, B, C,                 // quadrant visits (non-terminal)
    Up, Down, Left, Right       // unit moves
};

struct WorkItem {
    Symbol symbol;
    int depth;
};

// Single-use forward cursor over the curve. Yields side^2 entries starting at
// (0, (0,0)); the next call returns std::nullopt, and any call after that
// throws std::out_of_range.
class HilbertCursor {
public:
    explicit HilbertCursor(int depth);

    std::optional<TraversalEntry> next();

    // Pulls left before the cursor reports exhaustion.
    std::size_t remaining() const { return remaining_; }
    int side() const { return side_; }

private:
    bool expand_until_move();

    int side_;
    std::size_t remaining_;
    std::size_t index_ = 0;
    Coordinate pos_{0, 0};
    bool started_ = false;
    std::deque<WorkItem> queue_;
};

// Eager forms, drained from HilbertCursor.
std::vector<Coordinate> generate(int depth);
TraversalOrder traversal_order(int depth);

// floor(log2(n)) for n >= 1. Truncates non-powers of two.
int floor_log2(int n);

// Depth of the curve covering an n x n grid. Throws std::invalid_argument
// unless n is a positive power of two.
int depth_for_side(int n);

bool is_power_of_two(int n);

} // namespace hilbert
