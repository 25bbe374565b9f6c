#include "hilbert_curve.h"

#include <stdexcept>
#include <string>

namespace hilbert {

// 2^15 squared still indexes inside an int grid
static constexpr int MAX_DEPTH = 15;

// Right-hand sides for H, A, B, C, in Symbol order.
static const Symbol PRODUCTIONS[4][7] = {
    {Symbol::A, Symbol::Up,    Symbol::H, Symbol::Right, Symbol::H, Symbol::Down,  Symbol::B},
    {Symbol::H, Symbol::Right, Symbol::A, Symbol::Up,    Symbol::A, Symbol::Left,  Symbol::C},
    {Symbol::C, Symbol::Left,  Symbol::B, Symbol::Down,  Symbol::B, Symbol::Right, Symbol::H},
    {Symbol::B, Symbol::Down,  Symbol::C, Symbol::Left,  Symbol::C, Symbol::Up,    Symbol::A},
};

static bool is_curve_symbol(Symbol s) {
    return s == Symbol::H || s == Symbol::A || s == Symbol::B || s == Symbol::C;
}

HilbertCursor::HilbertCursor(int depth) {
    if (depth < 0 || depth > MAX_DEPTH) {
        throw std::invalid_argument("Hilbert depth out of range: " + std::to_string(depth));
    }
    side_ = 1 << depth;
    remaining_ = static_cast<std::size_t>(side_) * static_cast<std::size_t>(side_) + 1;
    queue_.push_back({Symbol::H, depth});
}

std::optional<TraversalEntry> HilbertCursor::next() {
    if (remaining_ == 0) {
        throw std::out_of_range("Hilbert iteration is out of bounds");
    }
    --remaining_;

    if (!started_) {
        started_ = true;
        return TraversalEntry{index_++, pos_};
    }
    if (!expand_until_move()) {
        return std::nullopt;
    }
    return TraversalEntry{index_++, pos_};
}

// Drains the queue until one move executes at depth 0. Returns false once the
// queue is empty.
bool HilbertCursor::expand_until_move() {
    while (!queue_.empty()) {
        const WorkItem item = queue_.front();
        queue_.pop_front();

        if (item.depth == 0) {
            switch (item.symbol) {
                case Symbol::Up:    ++pos_.row; return true;
                case Symbol::Down:  --pos_.row; return true;
                case Symbol::Right: ++pos_.col; return true;
                case Symbol::Left:  --pos_.col; return true;
                default: continue; // curve symbol at the base case draws nothing
            }
        }

        const int d = item.depth - 1;
        if (is_curve_symbol(item.symbol)) {
            for (Symbol s : PRODUCTIONS[static_cast<int>(item.symbol)]) {
                queue_.push_back({s, d});
            }
        } else {
            // moves wait until every enclosing quadrant has been expanded
            queue_.push_back({item.symbol, d});
        }
    }
    return false;
}

std::vector<Coordinate> generate(int depth) {
    HilbertCursor cursor(depth);
    std::vector<Coordinate> coords;
    coords.reserve(cursor.remaining() - 1);
    while (auto e = cursor.next()) {
        coords.push_back(e->coord);
    }
    return coords;
}

TraversalOrder traversal_order(int depth) {
    HilbertCursor cursor(depth);
    TraversalOrder order;
    order.reserve(cursor.remaining() - 1);
    while (auto e = cursor.next()) {
        order.push_back(*e);
    }
    return order;
}

int floor_log2(int n) {
    if (n < 1) {
        throw std::invalid_argument("log2 of non-positive value: " + std::to_string(n));
    }
    int d = 0;
    while (n > 1) {
        n >>= 1;
        ++d;
    }
    return d;
}

bool is_power_of_two(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

int depth_for_side(int n) {
    if (!is_power_of_two(n)) {
        throw std::invalid_argument("grid side must be a power of two, got " + std::to_string(n));
    }
    return floor_log2(n);
}

} // namespace hilbert
