#ifndef TMDLO_SOFTPLUS_LAYER_HPP_
#define TMDLO_SOFTPLUS_LAYER_HPP_

#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

/**
 * @brief Softplus non-linearity
 *        @f$ y = \frac{1}{\beta} \log(1 + \exp(\beta x)) @f$,
 *        strictly positive with a smooth gradient everywhere.
 *
 * Where @f$ \beta x @f$ exceeds softplus_param.threshold the output is taken
 * to be @f$ x @f$ itself, which avoids overflow in the exponential.
 */
template <typename Dtype>
class SoftplusLayer : public Layer<Dtype> {
 public:
  explicit SoftplusLayer(const LayerParameter& param)
      : Layer<Dtype>(param) {}
  virtual void LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);

  virtual inline const char* type() const { return "Softplus"; }
  virtual inline int ExactNumBottomBlobs() const { return 1; }
  virtual inline int ExactNumTopBlobs() const { return 1; }

 protected:
  /**
   * @param bottom input Blob vector (length 1)
   *   -# @f$ (N \times K) @f$
   *      the inputs @f$ x @f$
   * @param top output Blob vector (length 1)
   *   -# @f$ (N \times K) @f$
   *      the computed outputs @f$ y > 0 @f$
   */
  virtual void Forward_cpu(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);

  /**
   * @brief Computes the error gradient w.r.t. the softplus inputs,
   *        @f$ \frac{\partial E}{\partial x} =
   *            \frac{\partial E}{\partial y} \sigma(\beta x) @f$.
   */
  virtual void Backward_cpu(const vector<Blob<Dtype>*>& top,
      const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom);

  Dtype beta_;
  Dtype threshold_;
};

}  // namespace tmdlo

#endif  // TMDLO_SOFTPLUS_LAYER_HPP_
