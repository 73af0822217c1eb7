#ifndef TMDLO_UTIL_DIRICHLET_H_
#define TMDLO_UTIL_DIRICHLET_H_

#include "tmdlo/common.hpp"

namespace tmdlo {

// Single-sample Dirichlet opinion arithmetic. Evidence is laid out as
// views x classes, row major; every evidence entry must be non-negative.

// S = sum_k (e[k] + 1).
template <typename Dtype>
Dtype dirichlet_strength(const int classes, const Dtype* evidence);

// Writes the belief masses e[k] / S and returns the uncertainty mass K / S.
template <typename Dtype>
Dtype dirichlet_opinion(const int classes, const Dtype* evidence,
    Dtype* belief);

// Writes P[k] = b[k] + prior[k] * u and returns the strength S.
template <typename Dtype>
Dtype projected_probability(const int classes, const Dtype* evidence,
    const Dtype* prior, Dtype* prob);

// Shannon entropy in bits; 0 * log(0) is taken as 0.
template <typename Dtype>
Dtype entropy_log2(const int classes, const Dtype* prob);

// Accumulates evidence over views (alpha = sum_v e_v + 1), writes
// P = alpha / S and returns the fused strength S.
template <typename Dtype>
Dtype fused_prediction(const int views, const int classes,
    const Dtype* evidence, Dtype* prob);

// H((p + q) / 2) - H(p) / 2 - H(q) / 2. Non-negative, zero iff p == q.
template <typename Dtype>
Dtype pairwise_divergence(const int classes, const Dtype* p, const Dtype* q);

// Expected squared error plus variance of a Dirichlet with mean prob and
// strength S against the one-hot label.
template <typename Dtype>
Dtype expected_squared_error(const int classes, const Dtype* prob,
    const Dtype S, const int label);

// The same loss for the Dirichlet fused over all views.
template <typename Dtype>
Dtype dirichlet_accuracy_loss(const int views, const int classes,
    const Dtype* evidence, const int label);

// Sum over views m of the mean divergence between m and every other view,
// given the views x classes projected probabilities.
template <typename Dtype>
Dtype mean_pairwise_divergence(const int views, const int classes,
    const Dtype* prob);

// mean_pairwise_divergence of the projected probabilities of the evidence.
template <typename Dtype>
Dtype dirichlet_consistency_loss(const int views, const int classes,
    const Dtype* evidence, const Dtype* prior);

}  // namespace tmdlo

#endif  // TMDLO_UTIL_DIRICHLET_H_
