#include <cmath>
#include <vector>

#include "tmdlo/layers/softplus_layer.hpp"

namespace tmdlo {

template <typename Dtype>
void SoftplusLayer<Dtype>::LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top) {
  beta_ = this->layer_param_.softplus_param().beta();
  threshold_ = this->layer_param_.softplus_param().threshold();
  CHECK_GT(beta_, 0) << "Softplus beta must be positive.";
}

template <typename Dtype>
void SoftplusLayer<Dtype>::Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top) {
  top[0]->ReshapeLike(*bottom[0]);
}

template <typename Dtype>
void SoftplusLayer<Dtype>::Forward_cpu(const vector<Blob<Dtype>*>& bottom,
    const vector<Blob<Dtype>*>& top) {
  const Dtype* bottom_data = bottom[0]->cpu_data();
  Dtype* top_data = top[0]->mutable_cpu_data();
  const int count = bottom[0]->count();
  for (int i = 0; i < count; ++i) {
    const Dtype scaled = beta_ * bottom_data[i];
    top_data[i] = scaled > threshold_ ? bottom_data[i]
        : std::log1p(std::exp(scaled)) / beta_;
  }
}

template <typename Dtype>
void SoftplusLayer<Dtype>::Backward_cpu(const vector<Blob<Dtype>*>& top,
    const vector<bool>& propagate_down,
    const vector<Blob<Dtype>*>& bottom) {
  if (propagate_down[0]) {
    const Dtype* bottom_data = bottom[0]->cpu_data();
    const Dtype* top_diff = top[0]->cpu_diff();
    Dtype* bottom_diff = bottom[0]->mutable_cpu_diff();
    const int count = bottom[0]->count();
    for (int i = 0; i < count; ++i) {
      const Dtype scaled = beta_ * bottom_data[i];
      bottom_diff[i] = scaled > threshold_ ? top_diff[i]
          : top_diff[i] / (Dtype(1) + std::exp(-scaled));
    }
  }
}

INSTANTIATE_CLASS(SoftplusLayer);
REGISTER_LAYER_CLASS(Softplus);

}  // namespace tmdlo
