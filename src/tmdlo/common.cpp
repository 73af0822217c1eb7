#include <boost/thread.hpp>
#include <glog/logging.h>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <unistd.h>

#include "tmdlo/common.hpp"
#include "tmdlo/util/rng.hpp"

namespace tmdlo {

// Make sure each thread can have different values.
static boost::thread_specific_ptr<Tmdlo> thread_instance_;

Tmdlo& Tmdlo::Get() {
  if (!thread_instance_.get()) {
    thread_instance_.reset(new Tmdlo());
  }
  return *(thread_instance_.get());
}

// random seeding
int64_t cluster_seedgen(void) {
  int64_t s, seed, pid;
  FILE* f = fopen("/dev/urandom", "rb");
  if (f && fread(&seed, 1, sizeof(seed), f) == sizeof(seed)) {
    fclose(f);
    return seed;
  }

  LOG(INFO) << "System entropy source not available, "
              "using fallback algorithm to generate seed instead.";
  if (f)
    fclose(f);

  pid = getpid();
  s = time(NULL);
  seed = std::abs(((s * 181) * ((pid - 83) * 359)) % 104729);
  return seed;
}

void GlobalInit(int* pargc, char*** pargv) {
  // Google flags.
  ::gflags::ParseCommandLineFlags(pargc, pargv, true);
  // Google logging.
  ::google::InitGoogleLogging(*(pargv)[0]);
  // Provide a backtrace on segfault.
  ::google::InstallFailureSignalHandler();
}

Tmdlo::Tmdlo()
    : random_generator_() { }

Tmdlo::~Tmdlo() { }

void Tmdlo::set_random_seed(const unsigned int seed) {
  Get().random_generator_.reset(new RNG(seed));
}

class Tmdlo::RNG::Generator {
 public:
  Generator() : rng_(new tmdlo::rng_t(cluster_seedgen())) {}
  explicit Generator(unsigned int seed) : rng_(new tmdlo::rng_t(seed)) {}
  tmdlo::rng_t* rng() { return rng_.get(); }
 private:
  shared_ptr<tmdlo::rng_t> rng_;
};

Tmdlo::RNG::RNG() : generator_(new Generator()) { }

Tmdlo::RNG::RNG(unsigned int seed) : generator_(new Generator(seed)) { }

void* Tmdlo::RNG::generator() {
  return static_cast<void*>(generator_->rng());
}

}  // namespace tmdlo
