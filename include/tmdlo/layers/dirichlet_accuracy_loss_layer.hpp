#ifndef TMDLO_DIRICHLET_ACCURACY_LOSS_LAYER_HPP_
#define TMDLO_DIRICHLET_ACCURACY_LOSS_LAYER_HPP_

#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

#include "tmdlo/layers/loss_layer.hpp"

namespace tmdlo {

/**
 * @brief Computes the Bayes risk of the squared error under the Dirichlet
 *        obtained by accumulating the evidence of all views.
 *
 * With @f$ \alpha = \sum_v e_v + 1 @f$, @f$ S = \sum_k \alpha_k @f$ and
 * @f$ p = \alpha / S @f$ the per-sample loss is
 * @f$ \sum_k (y_k - p_k)^2 + \frac{p_k (1 - p_k)}{S + 1} @f$.
 *
 * @param bottom input Blob vector (length 2)
 *   -# @f$ (N \times V \times K) @f$
 *      the non-negative evidence of every view
 *   -# @f$ (N) @f$
 *      the labels, integral values in @f$ [0, K) @f$
 * @param top output Blob vector (length 1 or 2)
 *   -# @f$ () @f$ the normalized batch loss
 *   -# @f$ (N) @f$ the per-sample loss, optional
 */
template <typename Dtype>
class DirichletAccuracyLossLayer : public LossLayer<Dtype> {
 public:
  explicit DirichletAccuracyLossLayer(const LayerParameter& param)
      : LossLayer<Dtype>(param) {}
  virtual void LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);

  virtual inline const char* type() const { return "DirichletAccuracyLoss"; }
  virtual inline int ExactNumBottomBlobs() const { return 2; }

  /// @brief Fused prediction of the last forward pass, @f$ N \times K @f$.
  const Blob<Dtype>& prob() const { return prob_; }
  /// @brief Fused Dirichlet strength of the last forward pass, @f$ N @f$.
  const Blob<Dtype>& strength() const { return strength_; }

 protected:
  virtual void Forward_cpu(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top);
  virtual void Backward_cpu(const vector<Blob<Dtype>*>& top,
      const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom);

  int num_;
  int views_;
  int classes_;
  Blob<Dtype> prob_;
  Blob<Dtype> strength_;
  Blob<Dtype> sample_loss_;
};

}  // namespace tmdlo

#endif  // TMDLO_DIRICHLET_ACCURACY_LOSS_LAYER_HPP_
