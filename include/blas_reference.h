#pragma once

#include "matrix_utils.h"

// out = A * v computed by BLAS dgemv in double precision and rounded back.
// Exact while every partial sum stays below 2^53.
// Throws std::invalid_argument on size mismatch.
matrix_utils::Vector blas_reference_product(const matrix_utils::Matrix &A,
                                            const matrix_utils::Vector &v, int N);
