#ifndef TMDLO_DIRICHLET_CONSISTENCY_LOSS_LAYER_HPP_
#define TMDLO_DIRICHLET_CONSISTENCY_LOSS_LAYER_HPP_

#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

#include "tmdlo/layers/loss_layer.hpp"

namespace tmdlo {

/**
 * @brief Penalizes disagreement between the opinions of different views.
 *
 * Each view's evidence is turned into the projected probability
 * @f$ p_v = b_v + a u_v @f$ of its subjective opinion, with the prior
 * preference @f$ a @f$ taken from dirichlet_param.prior (uniform when
 * empty). For every view @f$ m @f$ the excess entropy
 * @f$ H(\frac{p_m + p_v}{2}) - \frac{H(p_m)}{2} - \frac{H(p_v)}{2} @f$ is
 * averaged over the @f$ V - 1 @f$ other views, and the averages are summed
 * over @f$ m @f$. Each unordered pair is therefore counted twice.
 *
 * @param bottom input Blob vector (length 1)
 *   -# @f$ (N \times V \times K) @f$
 *      the non-negative evidence of every view, @f$ V \ge 2 @f$
 * @param top output Blob vector (length 1 or 2)
 *   -# @f$ () @f$ the normalized batch loss
 *   -# @f$ (N) @f$ the per-sample loss, optional
 */
template <typename Dtype>
class DirichletConsistencyLossLayer : public LossLayer<Dtype> {
 public:
  explicit DirichletConsistencyLossLayer(const LayerParameter& param)
      : LossLayer<Dtype>(param) {}
  virtual void LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);

  virtual inline const char* type() const {
    return "DirichletConsistencyLoss";
  }
  virtual inline int ExactNumBottomBlobs() const { return 1; }

  const Blob<Dtype>& prior() const { return prior_; }

 protected:
  virtual void Forward_cpu(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Backward_cpu(const vector<Blob<Dtype>*>& top,
      const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom);

  int num_;
  int views_;
  int classes_;
  /// prior class preference, K
  Blob<Dtype> prior_;
  /// projected probability of every view, N x V x K
  Blob<Dtype> prob_;
  /// Dirichlet strength of every view, N x V
  Blob<Dtype> strength_;
  Blob<Dtype> sample_loss_;
};

}  // namespace tmdlo

#endif  // TMDLO_DIRICHLET_CONSISTENCY_LOSS_LAYER_HPP_
