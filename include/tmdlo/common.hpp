#ifndef TMDLO_COMMON_HPP_
#define TMDLO_COMMON_HPP_

#include <boost/shared_ptr.hpp>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <sstream>
#include <string>
#include <vector>

// gflags 2.1 issue: namespace google was changed to gflags without warning.
// Luckily we will be able to use GFLAGS_GFLAGS_H_ to detect if it is version
// 2.1. If yes, we will add a temporary solution to redirect the namespace.
#ifndef GFLAGS_GFLAGS_H_
namespace gflags = google;
#endif  // GFLAGS_GFLAGS_H_

// Disable the copy and assignment operator for a class.
#define DISABLE_COPY_AND_ASSIGN(classname) \
private:\
  classname(const classname&);\
  classname& operator=(const classname&)

// Instantiate a class with float and double specifications.
#define INSTANTIATE_CLASS(classname) \
  char gInstantiationGuard##classname; \
  template class classname<float>; \
  template class classname<double>

namespace tmdlo {

using boost::shared_ptr;

// Common classes from std that tmdlo often uses.
using std::ostringstream;
using std::string;
using std::vector;

// A global initialization function that you should call in your main function.
// Currently it initializes google flags and google logging.
void GlobalInit(int* pargc, char*** pargv);

// A singleton class to hold common tmdlo state, such as the random number
// generator. The instance is thread local.
class Tmdlo {
 public:
  ~Tmdlo();

  // Thread local context; the thread_specific_ptr lives in common.cpp.
  static Tmdlo& Get();

  // Facade over the boost generator so that headers need not include it.
  class RNG {
   public:
    RNG();
    explicit RNG(unsigned int seed);
    void* generator();
   private:
    class Generator;
    shared_ptr<Generator> generator_;
  };

  // Getters for boost rng.
  inline static RNG& rng_stream() {
    if (!Get().random_generator_) {
      Get().random_generator_.reset(new RNG());
    }
    return *(Get().random_generator_);
  }

  // Sets the random seed of the rng used by the fillers.
  static void set_random_seed(const unsigned int seed);

 protected:
  shared_ptr<RNG> random_generator_;

 private:
  // The private constructor to avoid duplicate instantiation.
  Tmdlo();

  DISABLE_COPY_AND_ASSIGN(Tmdlo);
};

}  // namespace tmdlo

#endif  // TMDLO_COMMON_HPP_
