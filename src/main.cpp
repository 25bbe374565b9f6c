#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bench_args.h"
#include "blas_reference.h"
#include "hilbert_curve.h"
#include "kernels.h"
#include "log.h"
#include "matrix_utils.h"
#include "perfctr.h"
#include "runner.h"

using matrix_utils::Matrix;
using matrix_utils::Vector;

static void print_vector(const Vector &v) {
    for (int32_t x : v) printf("%d\n", x);
}

static bool verify_against_blas(const Matrix &A, const Vector &v, const Vector &out, int N) {
    Vector ref = blas_reference_product(A, v, N);
    if (ref != out) {
        fprintf(stderr, "Error: output differs from the BLAS reference.\n");
        return false;
    }
    hlog::info("bench", "Output matches the BLAS reference.");
    return true;
}

static int run_single(const BenchOptions &opts) {
    const int N = opts.N;
    auto inputs = matrix_utils::setup_inputs(N, opts.seed);
    const Matrix &A = inputs.first;
    const Vector &v = inputs.second;
    Vector out(N, 0);

    double seconds = 0.0;
    if (opts.mode == BenchMode::Naive) {
        perfctr::start();
        seconds = run_benchmark(A.data(), v.data(), out.data(), N, opts.reps, kernel_naive);
        perfctr::stop();
    } else {
        auto t0 = std::chrono::high_resolution_clock::now();
        matrix_utils::HilbertSetup setup = matrix_utils::setup_hilbert(A, N);
        auto t1 = std::chrono::high_resolution_clock::now();
        hlog::info("bench", "hilbert data preprocessing: " +
                                std::to_string(std::chrono::duration<double>(t1 - t0).count()) + "s");

        perfctr::start();
        if (opts.mode == BenchMode::Hilbert) {
            seconds = run_benchmark_hilbert(setup.flattened.data(), v.data(), out.data(), N,
                                            opts.reps, setup.order);
        } else {
            seconds = run_benchmark_hilbert_lazy(setup.flattened.data(), v.data(), out.data(), N,
                                                 opts.reps, setup.depth);
        }
        perfctr::stop();
    }

    long long s = matrix_utils::checksum(out);
    fprintf(stderr, "SUMMARY\tN=%d\tmode=%s\tseed=%u\treps=%d\tseconds=%g\tchecksum=%lld\n",
            N, opts.mode_name.c_str(), opts.seed, opts.reps, seconds, s);

    if (opts.verify && !verify_against_blas(A, v, out, N)) return 1;
    if (opts.print_output) print_vector(out);
    return 0;
}

static int run_compare(const BenchOptions &opts) {
    const int N = opts.N;
    auto inputs = matrix_utils::setup_inputs(N, opts.seed);
    const Matrix &A = inputs.first;
    const Vector &v = inputs.second;
    Vector out_naive(N, 0);
    Vector out_hilbert(N, 0);

    perfctr::start();
    double naive_s = run_benchmark(A.data(), v.data(), out_naive.data(), N, opts.reps, kernel_naive);
    perfctr::Sample pc_naive = perfctr::stop();

    matrix_utils::HilbertSetup setup = matrix_utils::setup_hilbert(A, N);

    perfctr::start();
    double hilbert_s = run_benchmark_hilbert(setup.flattened.data(), v.data(), out_hilbert.data(),
                                             N, opts.reps, setup.order);
    perfctr::Sample pc_hilbert = perfctr::stop();

    if (out_naive != out_hilbert) {
        fprintf(stderr, "Error: naive and hilbert outputs differ.\n");
        return 1;
    }
    if (opts.verify && !verify_against_blas(A, v, out_naive, N)) return 1;

    std::cout << "Naive: " << naive_s << "s (" << naive_s / opts.reps << "s per)\n";
    std::cout << "Hilbert: " << hilbert_s << "s (" << hilbert_s / opts.reps << "s per)\n";
    if (naive_s > 0.0) {
        std::cout << "Improvement: " << 100.0 * (1.0 - hilbert_s / naive_s) << "%\n";
    }
    if (!pc_naive.names.empty()) {
        std::cout << "Counter\tnaive\thilbert\tratio\n" << perfctr::compare(pc_naive, pc_hilbert);
    }

    if (opts.print_output) print_vector(out_naive);
    return 0;
}

static void print_row(const char *label, int n, double seconds, const perfctr::Sample &pc) {
    std::cout << label << ", " << n << ", " << seconds;
    for (long long x : pc.values) std::cout << ", " << x;
    std::cout << "\n";
}

// CSV rows for every power of two from 32 (or N, if smaller) up to N.
static int run_sweep(const BenchOptions &opts) {
    std::vector<int> sizes;
    for (int n = opts.N < 32 ? opts.N : 32; n <= opts.N; n *= 2) sizes.push_back(n);

    for (int n : sizes) {
        auto inputs = matrix_utils::setup_inputs(n, opts.seed);
        Vector out(n, 0);
        perfctr::start();
        double s = run_benchmark(inputs.first.data(), inputs.second.data(), out.data(), n, opts.reps,
                                 kernel_naive);
        print_row("naive", n, s, perfctr::stop());
    }

    for (int n : sizes) {
        auto inputs = matrix_utils::setup_inputs(n, opts.seed);
        matrix_utils::HilbertSetup setup = matrix_utils::setup_hilbert(inputs.first, n);
        Vector out(n, 0);
        perfctr::start();
        double s = run_benchmark_hilbert(setup.flattened.data(), inputs.second.data(), out.data(), n,
                                         opts.reps, setup.order);
        print_row("hilbert", n, s, perfctr::stop());
    }
    return 0;
}

int main(int argc, char **argv) {
    BenchOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        usage(argv[0]);
        return 1;
    }
    if (opts.show_help) {
        usage(argv[0]);
        return 0;
    }
    hlog::set_quiet(opts.quiet);

    int rc = 0;
    try {
        perfctr::init();
        switch (opts.mode) {
            case BenchMode::Compare: rc = run_compare(opts); break;
            case BenchMode::Sweep:   rc = run_sweep(opts); break;
            default:                 rc = run_single(opts); break;
        }
    } catch (const std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        rc = 1;
    }
    perfctr::finalize();
    return rc;
}
