#include "blas_reference.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

// Fortran BLAS, hence the trailing underscore and pointer arguments.
extern "C" {
    void dgemv_(const char *TRANS, const int *M, const int *N, const double *ALPHA,
                const double *A, const int *LDA, const double *X, const int *INCX,
                const double *BETA, double *Y, const int *INCY);
}

matrix_utils::Vector blas_reference_product(const matrix_utils::Matrix &A,
                                            const matrix_utils::Vector &v, int N) {
    if (N <= 0 || A.size() != static_cast<std::size_t>(N) * N || v.size() != static_cast<std::size_t>(N)) {
        throw std::invalid_argument("blas_reference_product: size mismatch (N=" + std::to_string(N) + ")");
    }

    std::vector<double> a(A.begin(), A.end());
    std::vector<double> x(v.begin(), v.end());
    std::vector<double> y(N, 0.0);

    // BLAS is column-major, so our row-major A is seen as A^T; ask for the
    // transpose to get A * v.
    char trans = 'T';
    double alpha = 1.0;
    double beta = 0.0;
    int inc = 1;
    dgemv_(&trans, &N, &N, &alpha, a.data(), &N, x.data(), &inc, &beta, y.data(), &inc);

    matrix_utils::Vector out(N);
    for (int i = 0; i < N; ++i) out[i] = static_cast<int32_t>(std::llround(y[i]));
    return out;
}
