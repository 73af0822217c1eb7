#ifndef TMDLO_RNG_HPP_
#define TMDLO_RNG_HPP_

#include "boost/random/mersenne_twister.hpp"

#include "tmdlo/common.hpp"

namespace tmdlo {

typedef boost::mt19937 rng_t;

inline rng_t* tmdlo_rng() {
  return static_cast<tmdlo::rng_t*>(Tmdlo::rng_stream().generator());
}

}  // namespace tmdlo

#endif  // TMDLO_RNG_HPP_
