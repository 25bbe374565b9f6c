#include "runner.h"

#include <chrono>
#include <cstring>

template <typename Kernel>
static double time_reps(int32_t *out, int N, int reps, Kernel &&kernel) {
    auto t0 = std::chrono::high_resolution_clock::now();
    for (int r = 0; r < reps; ++r) {
        std::memset(out, 0, sizeof(int32_t) * size_t(N));
        kernel();
    }
    auto t1 = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = t1 - t0;
    return elapsed.count();
}

double run_benchmark(const int32_t *A, const int32_t *v, int32_t *out, int N, int reps,
                     mv_func_t kernel) {
    return time_reps(out, N, reps, [&] { kernel(A, v, out, N); });
}

double run_benchmark_hilbert(const int32_t *flat, const int32_t *v, int32_t *out, int N, int reps,
                             const hilbert::TraversalOrder &order) {
    return time_reps(out, N, reps, [&] { kernel_hilbert(flat, v, out, order); });
}

double run_benchmark_hilbert_lazy(const int32_t *flat, const int32_t *v, int32_t *out, int N,
                                  int reps, int depth) {
    return time_reps(out, N, reps, [&] { kernel_hilbert_lazy(flat, v, out, depth); });
}
