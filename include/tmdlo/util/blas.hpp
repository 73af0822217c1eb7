#ifndef TMDLO_UTIL_BLAS_H_
#define TMDLO_UTIL_BLAS_H_

extern "C" {
#include <cblas.h>
}

#endif  // TMDLO_UTIL_BLAS_H_
