#include <vector>

#include "tmdlo/layers/evidence_stack_layer.hpp"
#include "tmdlo/util/math_functions.hpp"

namespace tmdlo {

template <typename Dtype>
void EvidenceStackLayer<Dtype>::LayerSetUp(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top) {
  num_views_ = bottom.size();
  num_classes_ = this->layer_param_.evidence_stack_param().num_classes();
}

template <typename Dtype>
void EvidenceStackLayer<Dtype>::Reshape(const vector<Blob<Dtype>*>& bottom,
      const vector<Blob<Dtype>*>& top) {
  CHECK_EQ(bottom.size(), num_views_)
      << "EvidenceStack was set up for " << num_views_ << " views";
  CHECK_EQ(bottom[0]->num_axes(), 2)
      << "evidence must be N x classes, got " << bottom[0]->shape_string();
  num_ = bottom[0]->shape(0);
  const int classes = bottom[0]->shape(1);
  if (num_classes_ > 0) {
    CHECK_EQ(classes, num_classes_)
        << "evidence of view 0 has " << classes << " classes, expected "
        << num_classes_;
  }
  for (int v = 1; v < num_views_; ++v) {
    CHECK_EQ(bottom[v]->num_axes(), 2)
        << "evidence must be N x classes, got " << bottom[v]->shape_string();
    CHECK_EQ(bottom[v]->shape(0), num_)
        << "evidence of view " << v << " has a different batch size";
    CHECK_EQ(bottom[v]->shape(1), classes)
        << "evidence of view " << v << " has " << bottom[v]->shape(1)
        << " classes, expected " << classes;
  }
  vector<int> top_shape(3);
  top_shape[0] = num_;
  top_shape[1] = num_views_;
  top_shape[2] = classes;
  top[0]->Reshape(top_shape);
}

template <typename Dtype>
void EvidenceStackLayer<Dtype>::Forward_cpu(const vector<Blob<Dtype>*>& bottom,
    const vector<Blob<Dtype>*>& top) {
  Dtype* top_data = top[0]->mutable_cpu_data();
  const int classes = top[0]->shape(2);
  for (int v = 0; v < num_views_; ++v) {
    const Dtype* bottom_data = bottom[v]->cpu_data();
    for (int n = 0; n < num_; ++n) {
      tmdlo_copy(classes, bottom_data + n * classes,
          top_data + (n * num_views_ + v) * classes);
    }
  }
}

template <typename Dtype>
void EvidenceStackLayer<Dtype>::Backward_cpu(const vector<Blob<Dtype>*>& top,
    const vector<bool>& propagate_down, const vector<Blob<Dtype>*>& bottom) {
  const Dtype* top_diff = top[0]->cpu_diff();
  const int classes = top[0]->shape(2);
  for (int v = 0; v < num_views_; ++v) {
    if (!propagate_down[v]) { continue; }
    Dtype* bottom_diff = bottom[v]->mutable_cpu_diff();
    for (int n = 0; n < num_; ++n) {
      tmdlo_copy(classes, top_diff + (n * num_views_ + v) * classes,
          bottom_diff + n * classes);
    }
  }
}

INSTANTIATE_CLASS(EvidenceStackLayer);
REGISTER_LAYER_CLASS(EvidenceStack);

}  // namespace tmdlo
