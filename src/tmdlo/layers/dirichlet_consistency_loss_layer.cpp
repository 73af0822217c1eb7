#include <algorithm>
#include <cmath>
#include <vector>

#include "tmdlo/layers/dirichlet_consistency_loss_layer.hpp"
#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/math_functions.hpp"

namespace tmdlo {

template <typename Dtype>
void DirichletConsistencyLossLayer<Dtype>::LayerSetUp(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  LossLayer<Dtype>::LayerSetUp(bottom, top);
  CHECK_EQ(bottom[0]->num_axes(), 3)
      << "evidence must be N x views x classes, got "
      << bottom[0]->shape_string();
  const DirichletParameter& dirichlet_param =
      this->layer_param_.dirichlet_param();
  classes_ = bottom[0]->shape(2);
  if (dirichlet_param.num_classes() > 0) {
    CHECK_EQ(classes_, dirichlet_param.num_classes())
        << "evidence has " << classes_ << " classes, expected "
        << dirichlet_param.num_classes();
  }
  vector<int> prior_shape(1, classes_);
  prior_.Reshape(prior_shape);
  Dtype* prior = prior_.mutable_cpu_data();
  if (dirichlet_param.prior_size() == 0) {
    tmdlo_set(classes_, Dtype(1) / classes_, prior);
  } else {
    CHECK_EQ(dirichlet_param.prior_size(), classes_)
        << "prior must have one entry per class";
    for (int k = 0; k < classes_; ++k) {
      CHECK_GE(dirichlet_param.prior(k), 0)
          << "prior preference of class " << k << " is negative";
      prior[k] = dirichlet_param.prior(k);
    }
  }
}

template <typename Dtype>
void DirichletConsistencyLossLayer<Dtype>::Reshape(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  CHECK_EQ(bottom[0]->num_axes(), 3)
      << "evidence must be N x views x classes, got "
      << bottom[0]->shape_string();
  CHECK_EQ(bottom[0]->shape(2), classes_)
      << "evidence has " << bottom[0]->shape(2) << " classes, expected "
      << classes_;
  LossLayer<Dtype>::Reshape(bottom, top);
  num_ = bottom[0]->shape(0);
  views_ = bottom[0]->shape(1);
  CHECK_GE(views_, 2) << "consistency loss needs at least two views";
  prob_.ReshapeLike(*bottom[0]);
  vector<int> strength_shape(2);
  strength_shape[0] = num_;
  strength_shape[1] = views_;
  strength_.Reshape(strength_shape);
  vector<int> sample_shape(1, num_);
  sample_loss_.Reshape(sample_shape);
}

template <typename Dtype>
void DirichletConsistencyLossLayer<Dtype>::Forward_cpu(
    const vector<Blob<Dtype>*>& bottom, const vector<Blob<Dtype>*>& top) {
  const Dtype* evidence = bottom[0]->cpu_data();
  const Dtype* prior = prior_.cpu_data();
  Dtype* prob = prob_.mutable_cpu_data();
  Dtype* strength = strength_.mutable_cpu_data();
  Dtype* sample_loss = sample_loss_.mutable_cpu_data();
  const int dim = views_ * classes_;
  for (int n = 0; n < num_; ++n) {
    for (int v = 0; v < views_; ++v) {
      const int offset = n * dim + v * classes_;
      strength[n * views_ + v] = projected_probability(classes_,
          evidence + offset, prior, prob + offset);
    }
    sample_loss[n] = mean_pairwise_divergence(views_, classes_,
        prob + n * dim);
  }
  this->WriteLoss(sample_loss, num_, top);
}

template <typename Dtype>
void DirichletConsistencyLossLayer<Dtype>::Backward_cpu(
    const vector<Blob<Dtype>*>& top, const vector<bool>& propagate_down,
    const vector<Blob<Dtype>*>& bottom) {
  if (!propagate_down[0]) { return; }
  const Dtype* prob = prob_.cpu_data();
  const Dtype* strength = strength_.cpu_data();
  Dtype* bottom_diff = bottom[0]->mutable_cpu_diff();
  const Dtype scale = top[0]->cpu_diff()[0] /
      this->get_normalizer(this->normalization_, num_);
  const Dtype* sample_scale = top.size() > 1 ? top[1]->cpu_diff() : NULL;
  const Dtype threshold = Dtype(kLOG_THRESHOLD);
  vector<Dtype> grad_prob(classes_);
  const int dim = views_ * classes_;
  for (int n = 0; n < num_; ++n) {
    const Dtype coeff = (scale + (sample_scale ? sample_scale[n] : Dtype(0)))
        / Dtype(views_ - 1);
    for (int x = 0; x < views_; ++x) {
      const Dtype* p_x = prob + n * dim + x * classes_;
      // Both (x, w) and (w, x) contribute log2(p_x / mixture) / 2.
      tmdlo_set(classes_, Dtype(0), grad_prob.data());
      for (int w = 0; w < views_; ++w) {
        if (w == x) { continue; }
        const Dtype* p_w = prob + n * dim + w * classes_;
        for (int k = 0; k < classes_; ++k) {
          const Dtype p = std::max(p_x[k], threshold);
          const Dtype mixture = std::max((p_x[k] + p_w[k]) / Dtype(2),
              threshold);
          grad_prob[k] += std::log2(p / mixture);
        }
      }
      // Chain through p_x = (e_x + a K) / S_x.
      const Dtype grad_dot_p = tmdlo_cpu_dot(classes_, grad_prob.data(), p_x);
      const Dtype S = strength[n * views_ + x];
      Dtype* view_diff = bottom_diff + n * dim + x * classes_;
      for (int k = 0; k < classes_; ++k) {
        view_diff[k] = coeff * (grad_prob[k] - grad_dot_p) / S;
      }
    }
  }
}

INSTANTIATE_CLASS(DirichletConsistencyLossLayer);
REGISTER_LAYER_CLASS(DirichletConsistencyLoss);

}  // namespace tmdlo
