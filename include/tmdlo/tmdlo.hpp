// tmdlo.hpp is the header file that you need to include in your code. It wraps
// all the internal tmdlo header files into one for simpler inclusion.

#ifndef TMDLO_TMDLO_HPP_
#define TMDLO_TMDLO_HPP_

#include "tmdlo/blob.hpp"
#include "tmdlo/common.hpp"
#include "tmdlo/evidence_encoder.hpp"
#include "tmdlo/filler.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/layer_factory.hpp"
#include "tmdlo/multi_view_net.hpp"
#include "tmdlo/proto/tmdlo.pb.h"
#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/io.hpp"

#endif  // TMDLO_TMDLO_HPP_
