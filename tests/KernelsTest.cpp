#include "../include/blas_reference.h"
#include "../include/kernels.h"
#include "../include/matrix_utils.h"
#include "../include/runner.h"
#include <cassert>
#include <iostream>
#include <stdexcept>

using matrix_utils::Matrix;
using matrix_utils::Vector;

void test_naive_row_sums() {
  Matrix A = matrix_utils::fill_sequential(4);
  Vector v(4, 1);
  Vector out(4, 0);
  kernel_naive(A.data(), v.data(), out.data(), 4);
  assert((out == Vector{6, 22, 38, 54}));

  std::cout << "[PASS] test_naive_row_sums\n";
}

void test_hilbert_row_sums() {
  Matrix A = matrix_utils::fill_sequential(4);
  Vector v(4, 1);
  auto order = hilbert::traversal_order(2);
  Matrix flat = matrix_utils::flatten(A, order, 4);

  Vector out(4, 0);
  kernel_hilbert(flat.data(), v.data(), out.data(), order);
  assert((out == Vector{6, 22, 38, 54}));

  Vector lazy_out(4, 0);
  kernel_hilbert_lazy(flat.data(), v.data(), lazy_out.data(), 2);
  assert((lazy_out == Vector{6, 22, 38, 54}));

  std::cout << "[PASS] test_hilbert_row_sums\n";
}

void test_single_cell() {
  Matrix A{7};
  Vector v{3};
  auto order = hilbert::traversal_order(0);
  Vector naive(1, 0), curve(1, 0);
  kernel_naive(A.data(), v.data(), naive.data(), 1);
  kernel_hilbert(matrix_utils::flatten(A, order, 1).data(), v.data(), curve.data(), order);
  assert(naive[0] == 21);
  assert(curve[0] == 21);

  std::cout << "[PASS] test_single_cell\n";
}

void test_engines_agree() {
  const int sides[] = {4, 16, 256};
  for (int N : sides) {
    auto inputs = matrix_utils::setup_inputs(N, 10);
    const Matrix &A = inputs.first;
    const Vector &v = inputs.second;
    auto setup = matrix_utils::setup_hilbert(A, N);

    Vector naive(N, 0), curve(N, 0), lazy(N, 0);
    kernel_naive(A.data(), v.data(), naive.data(), N);
    kernel_hilbert(setup.flattened.data(), v.data(), curve.data(), setup.order);
    kernel_hilbert_lazy(setup.flattened.data(), v.data(), lazy.data(), setup.depth);

    assert(naive == curve);
    assert(naive == lazy);
    assert(naive == blas_reference_product(A, v, N));
  }

  std::cout << "[PASS] test_engines_agree\n";
}

void test_negative_values() {
  const int N = 16;
  Matrix A = matrix_utils::make_matrix(N, -100, 100, 5);
  Vector v(N);
  for (int j = 0; j < N; ++j) v[j] = (j % 2 ? -1 : 1) * (j + 1);

  auto setup = matrix_utils::setup_hilbert(A, N);
  Vector naive(N, 0), curve(N, 0);
  kernel_naive(A.data(), v.data(), naive.data(), N);
  kernel_hilbert(setup.flattened.data(), v.data(), curve.data(), setup.order);
  assert(naive == curve);
  assert(naive == blas_reference_product(A, v, N));

  std::cout << "[PASS] test_negative_values\n";
}

void test_kernels_accumulate() {
  Matrix A = matrix_utils::fill_sequential(4);
  Vector v(4, 1);
  Vector out{1, 1, 1, 1};
  kernel_naive(A.data(), v.data(), out.data(), 4);
  assert((out == Vector{7, 23, 39, 55}));

  std::cout << "[PASS] test_kernels_accumulate\n";
}

void test_blas_size_mismatch() {
  bool threw = false;
  try {
    blas_reference_product(Matrix(16, 1), Vector(3, 1), 4);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "[PASS] test_blas_size_mismatch\n";
}

void test_runners_reset_output() {
  const int N = 16;
  auto inputs = matrix_utils::setup_inputs(N, 3);
  const Matrix &A = inputs.first;
  const Vector &v = inputs.second;
  auto setup = matrix_utils::setup_hilbert(A, N);

  Vector once(N, 0);
  kernel_naive(A.data(), v.data(), once.data(), N);

  Vector out(N, 0);
  double s = run_benchmark(A.data(), v.data(), out.data(), N, 5, kernel_naive);
  assert(s >= 0.0);
  assert(out == once);

  run_benchmark_hilbert(setup.flattened.data(), v.data(), out.data(), N, 3, setup.order);
  assert(out == once);

  run_benchmark_hilbert_lazy(setup.flattened.data(), v.data(), out.data(), N, 2, setup.depth);
  assert(out == once);

  std::cout << "[PASS] test_runners_reset_output\n";
}

int main() {
  std::cout << "=== Kernel Tests ===\n";

  test_naive_row_sums();
  test_hilbert_row_sums();
  test_single_cell();
  test_engines_agree();
  test_negative_values();
  test_kernels_accumulate();
  test_blas_size_mismatch();
  test_runners_reset_output();

  std::cout << "\n=== All 8 tests passed! ===\n";
  return 0;
}
