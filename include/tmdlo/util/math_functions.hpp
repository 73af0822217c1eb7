#ifndef TMDLO_UTIL_MATH_FUNCTIONS_H_
#define TMDLO_UTIL_MATH_FUNCTIONS_H_

#include <stdint.h>
#include <cmath>

#include "glog/logging.h"

#include "tmdlo/common.hpp"
#include "tmdlo/util/blas.hpp"

namespace tmdlo {

// Tmdlo gemm provides a simpler interface to the gemm functions, with the
// limitation that the data has to be contiguous in memory.
template <typename Dtype>
void tmdlo_cpu_gemm(const CBLAS_TRANSPOSE TransA,
    const CBLAS_TRANSPOSE TransB, const int M, const int N, const int K,
    const Dtype alpha, const Dtype* A, const Dtype* B, const Dtype beta,
    Dtype* C);

template <typename Dtype>
void tmdlo_cpu_gemv(const CBLAS_TRANSPOSE TransA, const int M, const int N,
    const Dtype alpha, const Dtype* A, const Dtype* x, const Dtype beta,
    Dtype* y);

template <typename Dtype>
void tmdlo_axpy(const int N, const Dtype alpha, const Dtype* X,
    Dtype* Y);

template <typename Dtype>
void tmdlo_copy(const int N, const Dtype *X, Dtype *Y);

template <typename Dtype>
void tmdlo_set(const int N, const Dtype alpha, Dtype *X);

template <typename Dtype>
void tmdlo_scal(const int N, const Dtype alpha, Dtype *X);

template <typename Dtype>
void tmdlo_rng_uniform(const int n, const Dtype a, const Dtype b, Dtype* r);

template <typename Dtype>
void tmdlo_rng_gaussian(const int n, const Dtype mu, const Dtype sigma,
                        Dtype* r);

template <typename Dtype>
Dtype tmdlo_cpu_dot(const int n, const Dtype* x, const Dtype* y);

template <typename Dtype>
Dtype tmdlo_cpu_strided_dot(const int n, const Dtype* x, const int incx,
    const Dtype* y, const int incy);

// Returns the sum of the absolute values of the elements of vector x
template <typename Dtype>
Dtype tmdlo_cpu_asum(const int n, const Dtype* x);

// Returns the plain sum of the elements of vector x
template <typename Dtype>
Dtype tmdlo_cpu_sum(const int n, const Dtype* x);

}  // namespace tmdlo

#endif  // TMDLO_UTIL_MATH_FUNCTIONS_H_
