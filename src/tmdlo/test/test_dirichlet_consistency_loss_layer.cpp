#include <cmath>
#include <vector>

#include "gtest/gtest.h"

#include "tmdlo/blob.hpp"
#include "tmdlo/common.hpp"
#include "tmdlo/filler.hpp"
#include "tmdlo/layers/dirichlet_consistency_loss_layer.hpp"
#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/math_functions.hpp"

#include "tmdlo/test/test_gradient_check_util.hpp"
#include "tmdlo/test/test_tmdlo_main.hpp"

namespace tmdlo {

template <typename Dtype>
class DirichletConsistencyLossLayerTest : public ::testing::Test {
 protected:
  DirichletConsistencyLossLayerTest()
      : blob_bottom_evidence_(new Blob<Dtype>()),
        blob_top_loss_(new Blob<Dtype>()),
        blob_top_sample_loss_(new Blob<Dtype>()) {
    Tmdlo::set_random_seed(1701);
    vector<int> evidence_shape(3);
    evidence_shape[0] = 4;
    evidence_shape[1] = 3;
    evidence_shape[2] = 5;
    blob_bottom_evidence_->Reshape(evidence_shape);
    FillerParameter filler_param;
    filler_param.set_min(0);
    filler_param.set_max(4);
    UniformFiller<Dtype> filler(filler_param);
    filler.Fill(this->blob_bottom_evidence_);
    blob_bottom_vec_.push_back(blob_bottom_evidence_);
    blob_top_vec_.push_back(blob_top_loss_);
  }
  virtual ~DirichletConsistencyLossLayerTest() {
    delete blob_bottom_evidence_;
    delete blob_top_loss_;
    delete blob_top_sample_loss_;
  }

  Dtype ReferenceLoss(const Dtype* prior) {
    const int num = blob_bottom_evidence_->shape(0);
    const int dim = blob_bottom_evidence_->count(1);
    Dtype loss = 0;
    for (int n = 0; n < num; ++n) {
      loss += dirichlet_consistency_loss(3, 5,
          blob_bottom_evidence_->cpu_data() + n * dim, prior);
    }
    return loss / num;
  }

  Blob<Dtype>* const blob_bottom_evidence_;
  Blob<Dtype>* const blob_top_loss_;
  Blob<Dtype>* const blob_top_sample_loss_;
  vector<Blob<Dtype>*> blob_bottom_vec_;
  vector<Blob<Dtype>*> blob_top_vec_;
};

TYPED_TEST_CASE(DirichletConsistencyLossLayerTest, TestDtypes);

TYPED_TEST(DirichletConsistencyLossLayerTest, TestSetUpUniformPrior) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_);
  ASSERT_EQ(layer.prior().count(), 5);
  for (int k = 0; k < 5; ++k) {
    EXPECT_NEAR(Dtype(0.2), layer.prior().cpu_data()[k], 1e-6);
  }
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestForward) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_);
  const Dtype loss =
      layer.Forward(this->blob_bottom_vec_, this->blob_top_vec_);
  const Dtype expected = this->ReferenceLoss(layer.prior().cpu_data());
  EXPECT_GT(expected, Dtype(0));
  EXPECT_NEAR(expected, this->blob_top_loss_->cpu_data()[0], 1e-5);
  EXPECT_NEAR(expected, loss, 1e-5);
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestForwardPrior) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  const Dtype prior[5] = {0.1, 0.1, 0.2, 0.2, 0.4};
  for (int k = 0; k < 5; ++k) {
    layer_param.mutable_dirichlet_param()->add_prior(prior[k]);
  }
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_);
  layer.Forward(this->blob_bottom_vec_, this->blob_top_vec_);
  EXPECT_NEAR(this->ReferenceLoss(prior),
      this->blob_top_loss_->cpu_data()[0], 1e-5);
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestIdenticalViews) {
  typedef TypeParam Dtype;
  Dtype* evidence = this->blob_bottom_evidence_->mutable_cpu_data();
  for (int n = 0; n < 4; ++n) {
    for (int v = 1; v < 3; ++v) {
      tmdlo_copy(5, evidence + n * 15, evidence + n * 15 + v * 5);
    }
  }
  this->blob_top_vec_.push_back(this->blob_top_sample_loss_);
  LayerParameter layer_param;
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_);
  layer.Forward(this->blob_bottom_vec_, this->blob_top_vec_);
  EXPECT_NEAR(Dtype(0), this->blob_top_loss_->cpu_data()[0], 1e-5);
  for (int n = 0; n < 4; ++n) {
    EXPECT_NEAR(Dtype(0), this->blob_top_sample_loss_->cpu_data()[n], 1e-5);
  }
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestSingleView) {
  typedef TypeParam Dtype;
  vector<int> evidence_shape(3);
  evidence_shape[0] = 4;
  evidence_shape[1] = 1;
  evidence_shape[2] = 5;
  this->blob_bottom_evidence_->Reshape(evidence_shape);
  LayerParameter layer_param;
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  EXPECT_DEATH(layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_),
      "at least two views");
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestPriorWrongLength) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  layer_param.mutable_dirichlet_param()->add_prior(0.5);
  layer_param.mutable_dirichlet_param()->add_prior(0.5);
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  EXPECT_DEATH(layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_),
      "one entry per class");
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestNegativePrior) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  const float prior[5] = {0.5, 0.5, 0.5, -0.5, 0};
  for (int k = 0; k < 5; ++k) {
    layer_param.mutable_dirichlet_param()->add_prior(prior[k]);
  }
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  EXPECT_DEATH(layer.SetUp(this->blob_bottom_vec_, this->blob_top_vec_),
      "prior preference of class 3 is negative");
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestGradient) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  GradientChecker<Dtype> checker(1e-2, 1e-2, 1701);
  checker.CheckGradientExhaustive(&layer, this->blob_bottom_vec_,
      this->blob_top_vec_, 0);
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestGradientPrior) {
  typedef TypeParam Dtype;
  LayerParameter layer_param;
  const float prior[5] = {0.05, 0.15, 0.2, 0.25, 0.35};
  for (int k = 0; k < 5; ++k) {
    layer_param.mutable_dirichlet_param()->add_prior(prior[k]);
  }
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  GradientChecker<Dtype> checker(1e-2, 1e-2, 1701);
  checker.CheckGradientExhaustive(&layer, this->blob_bottom_vec_,
      this->blob_top_vec_, 0);
}

TYPED_TEST(DirichletConsistencyLossLayerTest, TestGradientPerSampleTop) {
  typedef TypeParam Dtype;
  this->blob_top_vec_.push_back(this->blob_top_sample_loss_);
  LayerParameter layer_param;
  DirichletConsistencyLossLayer<Dtype> layer(layer_param);
  GradientChecker<Dtype> checker(1e-2, 1e-2, 1701);
  checker.CheckGradientExhaustive(&layer, this->blob_bottom_vec_,
      this->blob_top_vec_, 0);
}

}  // namespace tmdlo
