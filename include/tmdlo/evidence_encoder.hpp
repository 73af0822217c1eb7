#ifndef TMDLO_EVIDENCE_ENCODER_HPP_
#define TMDLO_EVIDENCE_ENCODER_HPP_

#include <string>
#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/common.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

/**
 * @brief Maps the features of one view to non-negative class evidence.
 *
 * For view dimensions @f$ [d_0, d_1, \ldots, d_n] @f$ the encoder applies the
 * affine layers @f$ d_0 \to d_1, \ldots, d_{n-1} \to d_n, d_n \to K @f$
 * back to back, with no activation between them, and then a Softplus.
 * A single dimension gives a single affine layer @f$ d_0 \to K @f$.
 *
 * Features are @f$ N \times d_0 @f$, evidence is @f$ N \times K @f$.
 */
template <typename Dtype>
class EvidenceEncoder {
 public:
  EvidenceEncoder(const ViewParameter& view, const int num_classes,
      const FillerParameter& weight_filler,
      const FillerParameter& bias_filler,
      const SoftplusParameter& softplus_param);
  virtual ~EvidenceEncoder() {}

  void Forward(Blob<Dtype>* features, Blob<Dtype>* evidence);

  /**
   * @brief Back-propagates the diff of evidence into the parameter diffs.
   *
   * features and evidence must be the blobs of the preceding Forward call.
   * Parameter gradients are accumulated; the features receive no gradient.
   */
  void Backward(Blob<Dtype>* features, Blob<Dtype>* evidence);

  inline const string& name() const { return name_; }
  inline int input_dim() const { return input_dim_; }
  inline int num_classes() const { return num_classes_; }
  /// @brief Number of affine layers, one more than the hidden dimensions.
  inline int num_affine_layers() const { return affine_layers_.size(); }
  inline const vector<Blob<Dtype>*>& learnable_params() const {
    return learnable_params_;
  }

 protected:
  string name_;
  int input_dim_;
  int num_classes_;
  vector<shared_ptr<Layer<Dtype> > > affine_layers_;
  shared_ptr<Layer<Dtype> > activation_;
  /// outputs of the affine layers; the last one feeds the activation
  vector<shared_ptr<Blob<Dtype> > > affine_tops_;
  vector<Blob<Dtype>*> learnable_params_;

  DISABLE_COPY_AND_ASSIGN(EvidenceEncoder);
};

}  // namespace tmdlo

#endif  // TMDLO_EVIDENCE_ENCODER_HPP_
