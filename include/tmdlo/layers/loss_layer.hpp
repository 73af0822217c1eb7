#ifndef TMDLO_LOSS_LAYER_HPP_
#define TMDLO_LOSS_LAYER_HPP_

#include <vector>

#include "tmdlo/blob.hpp"
#include "tmdlo/layer.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

const float kLOG_THRESHOLD = 1e-20;

/**
 * @brief An interface for Layer%s that take evidence (and optionally labels)
 *        as input and output a singleton Blob representing the loss.
 *
 * The first top holds the batch loss and carries a default loss weight of 1.
 * Loss layers of this project may expose a second top with one loss value
 * per sample, before any normalization; it carries no weight by default.
 */
template <typename Dtype>
class LossLayer : public Layer<Dtype> {
 public:
  explicit LossLayer(const LayerParameter& param)
     : Layer<Dtype>(param) {}
  virtual void LayerSetUp(
      const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top);
  virtual void Reshape(
      const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top);

  virtual inline int ExactNumTopBlobs() const { return -1; }
  virtual inline int MinTopBlobs() const { return 1; }
  virtual inline int MaxTopBlobs() const { return 2; }

 protected:
  /**
   * Read the normalization mode parameter and compute the normalizer based
   * on the blob size.
   */
  virtual Dtype get_normalizer(
      LossParameter_NormalizationMode normalization_mode, int batch_size);

  /// Writes the batch loss and, if requested, the per-sample losses.
  void WriteLoss(const Dtype* sample_loss, int batch_size,
      const vector<Blob<Dtype>*>& top);

  LossParameter_NormalizationMode normalization_;
};

}  // namespace tmdlo

#endif  // TMDLO_LOSS_LAYER_HPP_
