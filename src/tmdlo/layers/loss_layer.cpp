#include <algorithm>
#include <vector>

#include "tmdlo/layers/loss_layer.hpp"

namespace tmdlo {

template <typename Dtype>
void LossLayer<Dtype>::LayerSetUp(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  // LossLayers have a non-zero (1) loss by default.
  if (this->layer_param_.loss_weight_size() == 0) {
    this->layer_param_.add_loss_weight(Dtype(1));
  }
  normalization_ = this->layer_param_.loss_param().normalization();
}

template <typename Dtype>
void LossLayer<Dtype>::Reshape(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  vector<int> loss_shape(0);  // Loss layers output a scalar; 0 axes.
  top[0]->Reshape(loss_shape);
  if (top.size() > 1) {
    vector<int> sample_shape(1, bottom[0]->shape(0));
    top[1]->Reshape(sample_shape);
  }
}

template <typename Dtype>
Dtype LossLayer<Dtype>::get_normalizer(
    LossParameter_NormalizationMode normalization_mode, int batch_size) {
  Dtype normalizer;
  switch (normalization_mode) {
    case LossParameter_NormalizationMode_BATCH_SIZE:
      normalizer = Dtype(batch_size);
      break;
    case LossParameter_NormalizationMode_NONE:
      normalizer = Dtype(1);
      break;
    default:
      LOG(FATAL) << "Unknown normalization mode: "
          << LossParameter_NormalizationMode_Name(normalization_mode);
  }
  // Some users will have no samples in a batch; in this case, prevent
  // divide by zero.
  return std::max(Dtype(1.0), normalizer);
}

template <typename Dtype>
void LossLayer<Dtype>::WriteLoss(const Dtype* sample_loss, int batch_size,
    const vector<Blob<Dtype>*>& top) {
  Dtype loss = tmdlo_cpu_sum(batch_size, sample_loss);
  top[0]->mutable_cpu_data()[0] =
      loss / get_normalizer(normalization_, batch_size);
  if (top.size() > 1) {
    tmdlo_copy(batch_size, sample_loss, top[1]->mutable_cpu_data());
  }
}

INSTANTIATE_CLASS(LossLayer);

}  // namespace tmdlo
