#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "hilbert_curve.h"

namespace matrix_utils {

using Matrix = std::vector<int32_t>; // N x N, row-major
using Vector = std::vector<int32_t>;

// Uniform values in [low, high] drawn from a seeded std::mt19937
Matrix make_matrix(int N, int32_t low, int32_t high, unsigned int seed);

// Matrix and vector with values in [1, 10]; the vector is drawn after the
// matrix from the same generator.
std::pair<Matrix, Vector> setup_inputs(int N, unsigned int seed);

// 0, 1, 2, ... in row-major order
Matrix fill_sequential(int N);

// Stores matrix entries in traversal order: flat[t] = A[i*N + j].
// Throws std::invalid_argument if A or order does not hold N*N entries.
Matrix flatten(const Matrix &A, const hilbert::TraversalOrder &order, int N);

// Inverse of flatten.
Matrix unflatten(const Matrix &flat, const hilbert::TraversalOrder &order, int N);

struct HilbertSetup {
    int depth;
    hilbert::TraversalOrder order;
    Matrix flattened;
};

// Derives the depth from N (power of two only), builds the order and the
// flattened matrix.
HilbertSetup setup_hilbert(const Matrix &A, int N);

long long checksum(const Vector &v);

} // namespace matrix_utils
