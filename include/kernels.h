#pragma once

#include <cstdint>

#include "hilbert_curve.h"

// Row-major kernels share this signature: out[i] += sum_j A[i*N+j] * v[j]
using mv_func_t = void (*)(const int32_t *A, const int32_t *v, int32_t *out, int N);

extern "C" void kernel_naive(const int32_t *A, const int32_t *v, int32_t *out, int N);

// Curve-order kernels read a matrix already permuted by matrix_utils::flatten.
// Accumulate into out; callers zero it beforehand.
void kernel_hilbert(const int32_t *flat, const int32_t *v, int32_t *out,
                    const hilbert::TraversalOrder &order);

// Same as kernel_hilbert, pulling coordinates from a HilbertCursor instead of
// a materialized order.
void kernel_hilbert_lazy(const int32_t *flat, const int32_t *v, int32_t *out, int depth);
