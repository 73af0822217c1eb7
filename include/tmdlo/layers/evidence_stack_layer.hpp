#ifndef TMDLO_EVIDENCE_STACK_LAYER_HPP_
#define TMDLO_EVIDENCE_STACK_LAYER_HPP_

#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

/**
 * @brief Stacks one evidence blob per view into a single
 *        @f$ N \times V \times K @f$ evidence blob.
 *
 * Each bottom is the @f$ N \times K @f$ evidence of one view. No values are
 * transformed; Backward scatters the stacked gradient back to the views.
 */
template <typename Dtype>
class EvidenceStackLayer : public Layer<Dtype> {
 public:
  explicit EvidenceStackLayer(const LayerParameter& param)
      : Layer<Dtype>(param) {}
  virtual void LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);

  virtual inline const char* type() const { return "EvidenceStack"; }
  virtual inline int MinBottomBlobs() const { return 1; }
  virtual inline int ExactNumTopBlobs() const { return 1; }

 protected:
  virtual void Forward_cpu(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Backward_cpu(const vector<Blob<Dtype>*>& top,
      const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom);

  int num_;
  int num_views_;
  int num_classes_;
};

}  // namespace tmdlo

#endif  // TMDLO_EVIDENCE_STACK_LAYER_HPP_
