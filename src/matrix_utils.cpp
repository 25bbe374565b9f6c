#include "matrix_utils.h"
#include "log.h"

#include <random>
#include <stdexcept>
#include <string>

namespace matrix_utils {

static void check_sizes(const char *what, std::size_t matrix_len, std::size_t order_len, int N) {
    const std::size_t expected = static_cast<std::size_t>(N) * static_cast<std::size_t>(N);
    if (N <= 0 || matrix_len != expected || order_len != expected) {
        throw std::invalid_argument(std::string(what) + ": size mismatch (N=" + std::to_string(N) +
                                    ", matrix=" + std::to_string(matrix_len) +
                                    ", order=" + std::to_string(order_len) + ")");
    }
}

Matrix make_matrix(int N, int32_t low, int32_t high, unsigned int seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int32_t> dist(low, high);
    Matrix A(static_cast<std::size_t>(N) * N);
    for (auto &x : A) x = dist(rng);
    return A;
}

std::pair<Matrix, Vector> setup_inputs(int N, unsigned int seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int32_t> dist(1, 10);
    Matrix A(static_cast<std::size_t>(N) * N);
    for (auto &x : A) x = dist(rng);
    Vector v(N);
    for (auto &x : v) x = dist(rng);
    return {std::move(A), std::move(v)};
}

Matrix fill_sequential(int N) {
    Matrix A(static_cast<std::size_t>(N) * N);
    for (std::size_t i = 0; i < A.size(); ++i) A[i] = static_cast<int32_t>(i);
    return A;
}

Matrix flatten(const Matrix &A, const hilbert::TraversalOrder &order, int N) {
    check_sizes("flatten", A.size(), order.size(), N);
    Matrix flat(A.size());
    for (const auto &e : order) {
        flat[e.index] = A[static_cast<std::size_t>(e.coord.row) * N + e.coord.col];
    }
    return flat;
}

Matrix unflatten(const Matrix &flat, const hilbert::TraversalOrder &order, int N) {
    check_sizes("unflatten", flat.size(), order.size(), N);
    Matrix A(flat.size());
    for (const auto &e : order) {
        A[static_cast<std::size_t>(e.coord.row) * N + e.coord.col] = flat[e.index];
    }
    return A;
}

HilbertSetup setup_hilbert(const Matrix &A, int N) {
    HilbertSetup s;
    s.depth = hilbert::depth_for_side(N);
    s.order = hilbert::traversal_order(s.depth);
    hlog::info("hilbert", "Hilbert matrix size: " + std::to_string(s.order.size()));
    s.flattened = flatten(A, s.order, N);
    return s;
}

long long checksum(const Vector &v) {
    long long s = 0;
    for (int32_t x : v) s += x;
    return s;
}

} // namespace matrix_utils
