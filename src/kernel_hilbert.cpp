#include "kernels.h"

#include <cassert>

// flat is read sequentially; v and out are hit in curve order.
void kernel_hilbert(const int32_t *flat, const int32_t *v, int32_t *out,
                    const hilbert::TraversalOrder &order) {
    assert(flat && v && out);
    for (const auto &e : order) {
        assert(e.index < order.size());
        out[e.coord.row] += flat[e.index] * v[e.coord.col];
    }
}

void kernel_hilbert_lazy(const int32_t *flat, const int32_t *v, int32_t *out, int depth) {
    assert(flat && v && out);
    hilbert::HilbertCursor cursor(depth);
    while (auto e = cursor.next()) {
        out[e->coord.row] += flat[e->index] * v[e->coord.col];
    }
}
