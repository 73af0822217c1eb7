#include <vector>

#include "tmdlo/layers/dirichlet_accuracy_loss_layer.hpp"
#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/math_functions.hpp"

namespace tmdlo {

template <typename Dtype>
void DirichletAccuracyLossLayer<Dtype>::LayerSetUp(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  LossLayer<Dtype>::LayerSetUp(bottom, top);
  classes_ = this->layer_param_.dirichlet_param().num_classes();
}

template <typename Dtype>
void DirichletAccuracyLossLayer<Dtype>::Reshape(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  CHECK_EQ(bottom[0]->num_axes(), 3)
      << "evidence must be N x views x classes, got "
      << bottom[0]->shape_string();
  LossLayer<Dtype>::Reshape(bottom, top);
  num_ = bottom[0]->shape(0);
  views_ = bottom[0]->shape(1);
  if (this->layer_param_.dirichlet_param().num_classes() > 0) {
    CHECK_EQ(bottom[0]->shape(2), classes_)
        << "evidence has " << bottom[0]->shape(2) << " classes, expected "
        << classes_;
  }
  classes_ = bottom[0]->shape(2);
  CHECK_EQ(bottom[1]->count(), num_)
      << "expected one label per sample";

  vector<int> prob_shape(2);
  prob_shape[0] = num_;
  prob_shape[1] = classes_;
  prob_.Reshape(prob_shape);
  vector<int> sample_shape(1, num_);
  strength_.Reshape(sample_shape);
  sample_loss_.Reshape(sample_shape);
}

template <typename Dtype>
void DirichletAccuracyLossLayer<Dtype>::Forward_cpu(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  const Dtype* evidence = bottom[0]->cpu_data();
  const Dtype* label = bottom[1]->cpu_data();
  Dtype* prob = prob_.mutable_cpu_data();
  Dtype* strength = strength_.mutable_cpu_data();
  Dtype* sample_loss = sample_loss_.mutable_cpu_data();
  const int dim = views_ * classes_;
  for (int n = 0; n < num_; ++n) {
    // Range checked on the Dtype value, before the cast.
    CHECK(label[n] >= 0 && label[n] < classes_) << "label " << label[n]
        << " of sample " << n << " must be in [0, " << classes_ << ")";
    const int label_value = static_cast<int>(label[n]);
    CHECK_EQ(static_cast<Dtype>(label_value), label[n])
        << "non-integer label " << label[n] << " for sample " << n;
    strength[n] = fused_prediction(views_, classes_, evidence + n * dim,
        prob + n * classes_);
    sample_loss[n] = expected_squared_error(classes_, prob + n * classes_,
        strength[n], label_value);
  }
  this->WriteLoss(sample_loss, num_, top);
}

template <typename Dtype>
void DirichletAccuracyLossLayer<Dtype>::Backward_cpu(
    const vector<Blob<Dtype>*>& top, const vector<bool>& propagate_down,
    const vector<Blob<Dtype>*>& bottom) {
  if (propagate_down[1]) {
    LOG(FATAL) << this->type()
               << " Layer cannot backpropagate to label inputs.";
  }
  if (propagate_down[0]) {
    const Dtype* label = bottom[1]->cpu_data();
    const Dtype* prob = prob_.cpu_data();
    const Dtype* strength = strength_.cpu_data();
    Dtype* bottom_diff = bottom[0]->mutable_cpu_diff();
    const Dtype scale = top[0]->cpu_diff()[0] /
        this->get_normalizer(this->normalization_, num_);
    const Dtype* sample_scale = top.size() > 1 ? top[1]->cpu_diff() : NULL;
    vector<Dtype> grad_prob(classes_);
    const int dim = views_ * classes_;
    for (int n = 0; n < num_; ++n) {
      const int label_value = static_cast<int>(label[n]);
      const Dtype* p = prob + n * classes_;
      const Dtype S = strength[n];
      const Dtype coeff = scale + (sample_scale ? sample_scale[n] : Dtype(0));
      // dL/dp at fixed S, and the explicit dependence of the variance on S.
      Dtype grad_dot_p = 0;
      Dtype variance = 0;
      for (int k = 0; k < classes_; ++k) {
        const Dtype y = (k == label_value ? Dtype(1) : Dtype(0));
        grad_prob[k] = Dtype(-2) * (y - p[k])
            + (Dtype(1) - Dtype(2) * p[k]) / (S + Dtype(1));
        grad_dot_p += grad_prob[k] * p[k];
        variance += p[k] * (Dtype(1) - p[k]);
      }
      const Dtype grad_strength = -variance / ((S + Dtype(1)) * (S + Dtype(1)));
      // Every view contributes its evidence to alpha with unit weight.
      Dtype* sample_diff = bottom_diff + n * dim;
      for (int k = 0; k < classes_; ++k) {
        sample_diff[k] =
            coeff * ((grad_prob[k] - grad_dot_p) / S + grad_strength);
      }
      for (int v = 1; v < views_; ++v) {
        tmdlo_copy(classes_, sample_diff, sample_diff + v * classes_);
      }
    }
  }
}

INSTANTIATE_CLASS(DirichletAccuracyLossLayer);
REGISTER_LAYER_CLASS(DirichletAccuracyLoss);

}  // namespace tmdlo
