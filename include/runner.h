#pragma once

#include <cstdint>

#include "hilbert_curve.h"
#include "kernels.h"

// Each runner zeroes out before every repetition and returns the total wall
// time in seconds for all reps.
double run_benchmark(const int32_t *A, const int32_t *v, int32_t *out, int N, int reps,
                     mv_func_t kernel);

double run_benchmark_hilbert(const int32_t *flat, const int32_t *v, int32_t *out, int N, int reps,
                             const hilbert::TraversalOrder &order);

double run_benchmark_hilbert_lazy(const int32_t *flat, const int32_t *v, int32_t *out, int N,
                                  int reps, int depth);
