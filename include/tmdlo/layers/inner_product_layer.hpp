#ifndef TMDLO_INNER_PRODUCT_LAYER_HPP_
#define TMDLO_INNER_PRODUCT_LAYER_HPP_

#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

/**
 * @brief Also known as a "fully-connected" layer, computes an inner product
 *        with a set of learned weights, and (optionally) adds biases.
 *
 * The weight blob is num_output x K, where K is the product of the bottom
 * dimensions from inner_product_param.axis onwards.
 */
template <typename Dtype>
class InnerProductLayer : public Layer<Dtype> {
 public:
  explicit InnerProductLayer(const LayerParameter& param)
      : Layer<Dtype>(param) {}
  virtual void LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);

  virtual inline const char* type() const { return "InnerProduct"; }
  virtual inline int ExactNumBottomBlobs() const { return 1; }
  virtual inline int ExactNumTopBlobs() const { return 1; }

 protected:
  virtual void Forward_cpu(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Backward_cpu(const vector<Blob<Dtype>*>& top,
      const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom);

  int M_;
  int K_;
  int N_;
  bool bias_term_;
  Blob<Dtype> bias_multiplier_;
};

}  // namespace tmdlo

#endif  // TMDLO_INNER_PRODUCT_LAYER_HPP_
