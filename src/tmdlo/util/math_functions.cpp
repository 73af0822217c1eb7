#include <boost/math/special_functions/next.hpp>
#include <boost/random.hpp>

#include <cstring>
#include <limits>

#include "tmdlo/common.hpp"
#include "tmdlo/util/math_functions.hpp"
#include "tmdlo/util/rng.hpp"

namespace tmdlo {

template<>
void tmdlo_cpu_gemm<float>(const CBLAS_TRANSPOSE TransA,
    const CBLAS_TRANSPOSE TransB, const int M, const int N, const int K,
    const float alpha, const float* A, const float* B, const float beta,
    float* C) {
  int lda = (TransA == CblasNoTrans) ? K : M;
  int ldb = (TransB == CblasNoTrans) ? N : K;
  cblas_sgemm(CblasRowMajor, TransA, TransB, M, N, K, alpha, A, lda, B,
      ldb, beta, C, N);
}

template<>
void tmdlo_cpu_gemm<double>(const CBLAS_TRANSPOSE TransA,
    const CBLAS_TRANSPOSE TransB, const int M, const int N, const int K,
    const double alpha, const double* A, const double* B, const double beta,
    double* C) {
  int lda = (TransA == CblasNoTrans) ? K : M;
  int ldb = (TransB == CblasNoTrans) ? N : K;
  cblas_dgemm(CblasRowMajor, TransA, TransB, M, N, K, alpha, A, lda, B,
      ldb, beta, C, N);
}

template <>
void tmdlo_cpu_gemv<float>(const CBLAS_TRANSPOSE TransA, const int M,
    const int N, const float alpha, const float* A, const float* x,
    const float beta, float* y) {
  cblas_sgemv(CblasRowMajor, TransA, M, N, alpha, A, N, x, 1, beta, y, 1);
}

template <>
void tmdlo_cpu_gemv<double>(const CBLAS_TRANSPOSE TransA, const int M,
    const int N, const double alpha, const double* A, const double* x,
    const double beta, double* y) {
  cblas_dgemv(CblasRowMajor, TransA, M, N, alpha, A, N, x, 1, beta, y, 1);
}

template <>
void tmdlo_axpy<float>(const int N, const float alpha, const float* X,
    float* Y) { cblas_saxpy(N, alpha, X, 1, Y, 1); }

template <>
void tmdlo_axpy<double>(const int N, const double alpha, const double* X,
    double* Y) { cblas_daxpy(N, alpha, X, 1, Y, 1); }

template <typename Dtype>
void tmdlo_set(const int N, const Dtype alpha, Dtype* Y) {
  if (alpha == 0) {
    memset(Y, 0, sizeof(Dtype) * N);
    return;
  }
  for (int i = 0; i < N; ++i) {
    Y[i] = alpha;
  }
}

template void tmdlo_set<float>(const int N, const float alpha, float* Y);
template void tmdlo_set<double>(const int N, const double alpha, double* Y);

template <typename Dtype>
void tmdlo_copy(const int N, const Dtype* X, Dtype* Y) {
  if (X != Y) {
    memcpy(Y, X, sizeof(Dtype) * N);
  }
}

template void tmdlo_copy<float>(const int N, const float* X, float* Y);
template void tmdlo_copy<double>(const int N, const double* X, double* Y);

template <>
void tmdlo_scal<float>(const int N, const float alpha, float *X) {
  cblas_sscal(N, alpha, X, 1);
}

template <>
void tmdlo_scal<double>(const int N, const double alpha, double *X) {
  cblas_dscal(N, alpha, X, 1);
}

template <typename Dtype>
Dtype tmdlo_nextafter(const Dtype b) {
  return boost::math::nextafter<Dtype>(
      b, std::numeric_limits<Dtype>::max());
}

template
float tmdlo_nextafter(const float b);

template
double tmdlo_nextafter(const double b);

template <typename Dtype>
void tmdlo_rng_uniform(const int n, const Dtype a, const Dtype b, Dtype* r) {
  CHECK_GE(n, 0);
  CHECK(r);
  CHECK_LE(a, b);
  boost::uniform_real<Dtype> random_distribution(a, tmdlo_nextafter<Dtype>(b));
  boost::variate_generator<tmdlo::rng_t*, boost::uniform_real<Dtype> >
      variate_generator(tmdlo_rng(), random_distribution);
  for (int i = 0; i < n; ++i) {
    r[i] = variate_generator();
  }
}

template
void tmdlo_rng_uniform<float>(const int n, const float a, const float b,
                              float* r);

template
void tmdlo_rng_uniform<double>(const int n, const double a, const double b,
                               double* r);

template <typename Dtype>
void tmdlo_rng_gaussian(const int n, const Dtype a,
                        const Dtype sigma, Dtype* r) {
  CHECK_GE(n, 0);
  CHECK(r);
  CHECK_GT(sigma, 0);
  boost::normal_distribution<Dtype> random_distribution(a, sigma);
  boost::variate_generator<tmdlo::rng_t*, boost::normal_distribution<Dtype> >
      variate_generator(tmdlo_rng(), random_distribution);
  for (int i = 0; i < n; ++i) {
    r[i] = variate_generator();
  }
}

template
void tmdlo_rng_gaussian<float>(const int n, const float mu,
                               const float sigma, float* r);

template
void tmdlo_rng_gaussian<double>(const int n, const double mu,
                                const double sigma, double* r);

template <>
float tmdlo_cpu_strided_dot<float>(const int n, const float* x, const int incx,
    const float* y, const int incy) {
  return cblas_sdot(n, x, incx, y, incy);
}

template <>
double tmdlo_cpu_strided_dot<double>(const int n, const double* x,
    const int incx, const double* y, const int incy) {
  return cblas_ddot(n, x, incx, y, incy);
}

template <typename Dtype>
Dtype tmdlo_cpu_dot(const int n, const Dtype* x, const Dtype* y) {
  return tmdlo_cpu_strided_dot(n, x, 1, y, 1);
}

template
float tmdlo_cpu_dot<float>(const int n, const float* x, const float* y);

template
double tmdlo_cpu_dot<double>(const int n, const double* x, const double* y);

template <>
float tmdlo_cpu_asum<float>(const int n, const float* x) {
  return cblas_sasum(n, x, 1);
}

template <>
double tmdlo_cpu_asum<double>(const int n, const double* x) {
  return cblas_dasum(n, x, 1);
}

template <typename Dtype>
Dtype tmdlo_cpu_sum(const int n, const Dtype* x) {
  Dtype sum = 0;
  for (int i = 0; i < n; ++i) {
    sum += x[i];
  }
  return sum;
}

template
float tmdlo_cpu_sum<float>(const int n, const float* x);

template
double tmdlo_cpu_sum<double>(const int n, const double* x);

}  // namespace tmdlo
