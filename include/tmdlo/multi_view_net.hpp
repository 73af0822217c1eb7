#ifndef TMDLO_MULTI_VIEW_NET_HPP_
#define TMDLO_MULTI_VIEW_NET_HPP_

#include <string>
#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/common.hpp"
#include "tmdlo/evidence_encoder.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

/**
 * @brief Multi-view classifier whose views each produce Dirichlet evidence.
 *
 * One EvidenceEncoder per view maps that view's features to evidence, the
 * evidence is stacked per sample and scored by the DirichletAccuracyLoss on
 * the fused opinion and by the DirichletConsistencyLoss between views. The
 * objective is @f$ L_{acc} + \lambda_{con} L_{con} @f$, realized through
 * the loss weights of the two loss layers.
 */
template <typename Dtype>
class MultiViewNet {
 public:
  explicit MultiViewNet(const MultiViewNetParameter& param);
  explicit MultiViewNet(const string& param_file);
  virtual ~MultiViewNet() {}

  /// @brief Initialize a network with a MultiViewNetParameter.
  void Init(const MultiViewNetParameter& param);

  /**
   * @brief Runs the encoders and returns the evidence of every view.
   *
   * @param features one @f$ N \times d_v @f$ blob per view, in view order
   * @return the @f$ N \times V \times K @f$ evidence blob
   */
  const Blob<Dtype>& Infer(const vector<Blob<Dtype>*>& features);

  /**
   * @brief Runs Infer and both losses.
   *
   * @param label @f$ (N) @f$ integral class indices
   * @return @f$ L_{acc} + \lambda_{con} L_{con} @f$, normalized over the batch
   *         according to loss_param
   *
   * The feature and label blobs must stay alive until Backward returns.
   */
  Dtype Forward(const vector<Blob<Dtype>*>& features, Blob<Dtype>* label);

  /**
   * @brief Accumulates the gradient of the last Forward objective into the
   *        diffs of learnable_params().
   *
   * Dies unless the last pass was a Forward; an Infer in between discards
   * the labels of that Forward.
   */
  void Backward();

  Dtype ForwardBackward(const vector<Blob<Dtype>*>& features,
      Blob<Dtype>* label) {
    Dtype loss = Forward(features, label);
    Backward();
    return loss;
  }

  /**
   * @brief Fused prediction for the evidence of the last Infer or Forward.
   *
   * Fills prob (@f$ N \times K @f$, @f$ \alpha / S @f$ of the fused Dirichlet)
   * and uncertainty (@f$ N @f$, @f$ K / S @f$), and returns the most probable
   * class of every sample.
   */
  vector<int> Predict(Blob<Dtype>* prob, Blob<Dtype>* uncertainty) const;

  /// @brief Zeroes out the diffs of all net parameters.
  void ClearParamDiffs();
  /// @brief Applies data -= diff to every learnable parameter.
  void Update();

  inline const string& name() const { return name_; }
  inline int num_views() const { return encoders_.size(); }
  inline int num_classes() const { return num_classes_; }
  inline Dtype lambda_con() const { return lambda_con_; }
  inline const EvidenceEncoder<Dtype>& encoder(int view) const {
    CHECK_GE(view, 0);
    CHECK_LT(view, encoders_.size());
    return *encoders_[view];
  }
  /// @brief The prior class preference used by the consistency loss.
  const Blob<Dtype>& prior() const;
  inline const Blob<Dtype>& evidence() const { return evidence_; }
  inline const vector<Blob<Dtype>*>& learnable_params() const {
    return learnable_params_;
  }

  /// @brief Unweighted accuracy loss of the last Forward.
  inline Dtype accuracy_loss() const { return accuracy_loss_.cpu_data()[0]; }
  /// @brief Unweighted consistency loss of the last Forward.
  inline Dtype consistency_loss() const {
    return consistency_loss_.cpu_data()[0];
  }
  /// @brief Per-sample @f$ L_{acc} + \lambda_{con} L_{con} @f$ before any
  ///        batch normalization.
  inline const Blob<Dtype>& sample_loss() const { return sample_loss_; }

 protected:
  void CheckFeatures(const vector<Blob<Dtype>*>& features) const;

  string name_;
  int num_classes_;
  Dtype lambda_con_;

  vector<shared_ptr<EvidenceEncoder<Dtype> > > encoders_;
  vector<shared_ptr<Blob<Dtype> > > view_evidence_;
  vector<Blob<Dtype>*> view_evidence_vecs_;

  shared_ptr<Layer<Dtype> > stack_layer_;
  shared_ptr<Layer<Dtype> > accuracy_layer_;
  shared_ptr<Layer<Dtype> > consistency_layer_;

  Blob<Dtype> evidence_;
  /// shares data with evidence_ but keeps the consistency gradient apart
  Blob<Dtype> consistency_evidence_;
  Blob<Dtype> accuracy_loss_;
  Blob<Dtype> accuracy_sample_loss_;
  Blob<Dtype> consistency_loss_;
  Blob<Dtype> consistency_sample_loss_;
  Blob<Dtype> sample_loss_;

  vector<Blob<Dtype>*> features_;
  Blob<Dtype>* label_;

  vector<Blob<Dtype>*> learnable_params_;

  DISABLE_COPY_AND_ASSIGN(MultiViewNet);
};

}  // namespace tmdlo

#endif  // TMDLO_MULTI_VIEW_NET_HPP_
