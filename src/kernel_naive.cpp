#include "kernels.h"

#include <cassert>

extern "C" void kernel_naive(const int32_t *A, const int32_t *v, int32_t *out, int N) {
    assert(A && v && out && N > 0);
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            out[i] += A[i * N + j] * v[j];
        }
    }
}
