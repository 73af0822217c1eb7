#include <cmath>
#include <vector>

#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/math_functions.hpp"

namespace tmdlo {

template <typename Dtype>
Dtype dirichlet_strength(const int classes, const Dtype* evidence) {
  return tmdlo_cpu_sum(classes, evidence) + Dtype(classes);
}

template <typename Dtype>
Dtype dirichlet_opinion(const int classes, const Dtype* evidence,
    Dtype* belief) {
  const Dtype S = dirichlet_strength(classes, evidence);
  for (int k = 0; k < classes; ++k) {
    belief[k] = evidence[k] / S;
  }
  return Dtype(classes) / S;
}

template <typename Dtype>
Dtype projected_probability(const int classes, const Dtype* evidence,
    const Dtype* prior, Dtype* prob) {
  const Dtype uncertainty = dirichlet_opinion(classes, evidence, prob);
  tmdlo_axpy(classes, uncertainty, prior, prob);
  return Dtype(classes) / uncertainty;
}

template <typename Dtype>
Dtype entropy_log2(const int classes, const Dtype* prob) {
  Dtype entropy = 0;
  for (int k = 0; k < classes; ++k) {
    if (prob[k] > 0) {
      entropy -= prob[k] * std::log2(prob[k]);
    }
  }
  return entropy;
}

template <typename Dtype>
Dtype fused_prediction(const int views, const int classes,
    const Dtype* evidence, Dtype* prob) {
  tmdlo_set(classes, Dtype(1), prob);
  for (int v = 0; v < views; ++v) {
    tmdlo_axpy(classes, Dtype(1), evidence + v * classes, prob);
  }
  const Dtype S = tmdlo_cpu_sum(classes, prob);
  tmdlo_scal(classes, Dtype(1) / S, prob);
  return S;
}

template <typename Dtype>
Dtype pairwise_divergence(const int classes, const Dtype* p, const Dtype* q) {
  std::vector<Dtype> mixture(classes);
  for (int k = 0; k < classes; ++k) {
    mixture[k] = (p[k] + q[k]) / Dtype(2);
  }
  return entropy_log2(classes, mixture.data())
      - entropy_log2(classes, p) / Dtype(2)
      - entropy_log2(classes, q) / Dtype(2);
}

template <typename Dtype>
Dtype expected_squared_error(const int classes, const Dtype* prob,
    const Dtype S, const int label) {
  CHECK_GE(label, 0) << "label must be in [0, " << classes << ")";
  CHECK_LT(label, classes) << "label must be in [0, " << classes << ")";
  Dtype loss = 0;
  for (int k = 0; k < classes; ++k) {
    const Dtype diff = (k == label ? Dtype(1) : Dtype(0)) - prob[k];
    loss += diff * diff + prob[k] * (Dtype(1) - prob[k]) / (S + Dtype(1));
  }
  return loss;
}

template <typename Dtype>
Dtype dirichlet_accuracy_loss(const int views, const int classes,
    const Dtype* evidence, const int label) {
  std::vector<Dtype> prob(classes);
  const Dtype S = fused_prediction(views, classes, evidence, prob.data());
  return expected_squared_error(classes, prob.data(), S, label);
}

template <typename Dtype>
Dtype mean_pairwise_divergence(const int views, const int classes,
    const Dtype* prob) {
  CHECK_GE(views, 2) << "consistency needs at least two views";
  Dtype loss = 0;
  for (int m = 0; m < views; ++m) {
    Dtype view_loss = 0;
    for (int v = 0; v < views; ++v) {
      if (v == m) { continue; }
      view_loss += pairwise_divergence(classes, prob + m * classes,
          prob + v * classes);
    }
    loss += view_loss / Dtype(views - 1);
  }
  return loss;
}

template <typename Dtype>
Dtype dirichlet_consistency_loss(const int views, const int classes,
    const Dtype* evidence, const Dtype* prior) {
  CHECK_GE(views, 2) << "consistency needs at least two views";
  std::vector<Dtype> prob(views * classes);
  for (int v = 0; v < views; ++v) {
    projected_probability(classes, evidence + v * classes, prior,
        prob.data() + v * classes);
  }
  return mean_pairwise_divergence(views, classes, prob.data());
}

#define INSTANTIATE_DIRICHLET(Dtype) \
  template Dtype dirichlet_strength<Dtype>(const int, const Dtype*); \
  template Dtype dirichlet_opinion<Dtype>(const int, const Dtype*, Dtype*); \
  template Dtype projected_probability<Dtype>(const int, const Dtype*, \
      const Dtype*, Dtype*); \
  template Dtype entropy_log2<Dtype>(const int, const Dtype*); \
  template Dtype fused_prediction<Dtype>(const int, const int, const Dtype*, \
      Dtype*); \
  template Dtype pairwise_divergence<Dtype>(const int, const Dtype*, \
      const Dtype*); \
  template Dtype expected_squared_error<Dtype>(const int, const Dtype*, \
      const Dtype, const int); \
  template Dtype dirichlet_accuracy_loss<Dtype>(const int, const int, \
      const Dtype*, const int); \
  template Dtype mean_pairwise_divergence<Dtype>(const int, const int, \
      const Dtype*); \
  template Dtype dirichlet_consistency_loss<Dtype>(const int, const int, \
      const Dtype*, const Dtype*)

INSTANTIATE_DIRICHLET(float);
INSTANTIATE_DIRICHLET(double);

}  // namespace tmdlo
