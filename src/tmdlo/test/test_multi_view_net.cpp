#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "tmdlo/blob.hpp"
#include "tmdlo/common.hpp"
#include "tmdlo/filler.hpp"
#include "tmdlo/multi_view_net.hpp"
#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/math_functions.hpp"

#include "tmdlo/test/test_tmdlo_main.hpp"

namespace tmdlo {

template <typename Dtype>
class MultiViewNetTest : public ::testing::Test {
 protected:
  MultiViewNetTest() : label_(new Blob<Dtype>()) {}

  virtual void SetUp() {
    Tmdlo::set_random_seed(1701);
    param_.set_name("test_net");
    param_.set_num_classes(3);
    param_.set_lambda_con(0.5);
    ViewParameter* view = param_.add_view();
    view->set_name("a");
    view->add_dim(4);
    view = param_.add_view();
    view->set_name("b");
    view->add_dim(3);
    view->add_dim(5);
    param_.mutable_weight_filler()->set_type("gaussian");
    param_.mutable_weight_filler()->set_std(0.5);
    param_.mutable_bias_filler()->set_type("constant");
    param_.mutable_bias_filler()->set_value(0.1);
  }

  virtual ~MultiViewNetTest() {
    for (int v = 0; v < features_.size(); ++v) {
      delete features_[v];
    }
    delete label_;
  }

  void FillBatch(int num) {
    for (int v = 0; v < features_.size(); ++v) {
      delete features_[v];
    }
    features_.clear();
    FillerParameter filler_param;
    filler_param.set_min(-1);
    filler_param.set_max(1);
    UniformFiller<Dtype> filler(filler_param);
    for (int v = 0; v < param_.view_size(); ++v) {
      vector<int> shape(2);
      shape[0] = num;
      shape[1] = param_.view(v).dim(0);
      features_.push_back(new Blob<Dtype>(shape));
      filler.Fill(features_.back());
    }
    label_->Reshape(vector<int>(1, num));
    for (int n = 0; n < num; ++n) {
      label_->mutable_cpu_data()[n] = n % param_.num_classes();
    }
  }

  MultiViewNetParameter param_;
  vector<Blob<Dtype>*> features_;
  Blob<Dtype>* const label_;
};

TYPED_TEST_CASE(MultiViewNetTest, TestDtypes);

TYPED_TEST(MultiViewNetTest, TestInit) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  EXPECT_EQ(net.name(), "test_net");
  EXPECT_EQ(net.num_views(), 2);
  EXPECT_EQ(net.num_classes(), 3);
  EXPECT_EQ(net.lambda_con(), Dtype(0.5));
  EXPECT_EQ(net.encoder(0).name(), "a");
  EXPECT_EQ(net.encoder(0).num_affine_layers(), 1);
  EXPECT_EQ(net.encoder(1).name(), "b");
  EXPECT_EQ(net.encoder(1).num_affine_layers(), 2);
  // weight and bias for 4 -> 3, 3 -> 5 and 5 -> 3
  EXPECT_EQ(net.learnable_params().size(), 6);
  ASSERT_EQ(net.prior().count(), 3);
  for (int k = 0; k < 3; ++k) {
    EXPECT_NEAR(Dtype(1) / 3, net.prior().cpu_data()[k], 1e-6);
  }
}

TYPED_TEST(MultiViewNetTest, TestDefaultViewNames) {
  typedef TypeParam Dtype;
  this->param_.mutable_view(0)->clear_name();
  this->param_.mutable_view(1)->clear_name();
  MultiViewNet<Dtype> net(this->param_);
  EXPECT_EQ(net.encoder(0).name(), "view0");
  EXPECT_EQ(net.encoder(1).name(), "view1");
}

TYPED_TEST(MultiViewNetTest, TestTooFewClasses) {
  typedef TypeParam Dtype;
  this->param_.set_num_classes(1);
  EXPECT_DEATH({ MultiViewNet<Dtype> net(this->param_); },
      "num_classes must be at least 2");
}

TYPED_TEST(MultiViewNetTest, TestSingleView) {
  typedef TypeParam Dtype;
  this->param_.mutable_view()->RemoveLast();
  EXPECT_DEATH({ MultiViewNet<Dtype> net(this->param_); },
      "at least two views");
}

TYPED_TEST(MultiViewNetTest, TestNegativeLambda) {
  typedef TypeParam Dtype;
  this->param_.set_lambda_con(-1);
  EXPECT_DEATH({ MultiViewNet<Dtype> net(this->param_); },
      "lambda_con must be non-negative");
}

TYPED_TEST(MultiViewNetTest, TestPriorWrongLength) {
  typedef TypeParam Dtype;
  this->param_.add_prior(0.5);
  this->param_.add_prior(0.5);
  EXPECT_DEATH({ MultiViewNet<Dtype> net(this->param_); },
      "one entry per class");
}

TYPED_TEST(MultiViewNetTest, TestInfer) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(4);
  const Blob<Dtype>& evidence = net.Infer(this->features_);
  ASSERT_EQ(evidence.num_axes(), 3);
  EXPECT_EQ(evidence.shape(0), 4);
  EXPECT_EQ(evidence.shape(1), 2);
  EXPECT_EQ(evidence.shape(2), 3);
  for (int i = 0; i < evidence.count(); ++i) {
    EXPECT_GE(evidence.cpu_data()[i], Dtype(0));
  }
}

TYPED_TEST(MultiViewNetTest, TestInferWrongViewCount) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(4);
  vector<Blob<Dtype>*> features(1, this->features_[0]);
  EXPECT_DEATH(net.Infer(features), "expected features for 2 views, got 1");
}

TYPED_TEST(MultiViewNetTest, TestInferBatchMismatch) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(4);
  vector<int> shape(2);
  shape[0] = 2;
  shape[1] = 3;
  this->features_[1]->Reshape(shape);
  EXPECT_DEATH(net.Infer(this->features_),
      "view b has a different number of samples");
}

TYPED_TEST(MultiViewNetTest, TestInferWrongFeatureDim) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(4);
  vector<int> shape(2);
  shape[0] = 4;
  shape[1] = 7;
  this->features_[0]->Reshape(shape);
  EXPECT_DEATH(net.Infer(this->features_), "view a expects 4 features");
}

TYPED_TEST(MultiViewNetTest, TestForward) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(5);
  const Dtype loss = net.Forward(this->features_, this->label_);
  const Blob<Dtype>& evidence = net.evidence();
  const int dim = evidence.count(1);
  Dtype accuracy = 0;
  Dtype consistency = 0;
  for (int n = 0; n < 5; ++n) {
    const Dtype sample_accuracy = dirichlet_accuracy_loss(2, 3,
        evidence.cpu_data() + n * dim,
        static_cast<int>(this->label_->cpu_data()[n]));
    const Dtype sample_consistency = dirichlet_consistency_loss(2, 3,
        evidence.cpu_data() + n * dim, net.prior().cpu_data());
    EXPECT_NEAR(sample_accuracy + Dtype(0.5) * sample_consistency,
        net.sample_loss().cpu_data()[n], 1e-5);
    accuracy += sample_accuracy;
    consistency += sample_consistency;
  }
  accuracy /= 5;
  consistency /= 5;
  EXPECT_NEAR(accuracy, net.accuracy_loss(), 1e-5);
  EXPECT_NEAR(consistency, net.consistency_loss(), 1e-5);
  EXPECT_NEAR(accuracy + Dtype(0.5) * consistency, loss, 1e-5);
}

TYPED_TEST(MultiViewNetTest, TestForwardNoConsistency) {
  typedef TypeParam Dtype;
  this->param_.set_lambda_con(0);
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(3);
  const Dtype loss = net.Forward(this->features_, this->label_);
  EXPECT_NEAR(net.accuracy_loss(), loss, 1e-6);
  EXPECT_GE(net.consistency_loss(), Dtype(0));
}

TYPED_TEST(MultiViewNetTest, TestForwardNoNormalization) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->param_.mutable_loss_param()->set_normalization(
      LossParameter_NormalizationMode_NONE);
  Tmdlo::set_random_seed(1701);
  MultiViewNet<Dtype> sum_net(this->param_);
  this->FillBatch(4);
  const Dtype mean_loss = net.Forward(this->features_, this->label_);
  const Dtype sum_loss = sum_net.Forward(this->features_, this->label_);
  EXPECT_NEAR(4 * mean_loss, sum_loss, 1e-4);
}

TYPED_TEST(MultiViewNetTest, TestViewOrderInvariance) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  MultiViewNetParameter swapped_param(this->param_);
  swapped_param.mutable_view()->SwapElements(0, 1);
  MultiViewNet<Dtype> swapped(swapped_param);
  // Give the swapped net the same encoders.
  for (int v = 0; v < 2; ++v) {
    const vector<Blob<Dtype>*>& source = net.encoder(v).learnable_params();
    const vector<Blob<Dtype>*>& target =
        swapped.encoder(1 - v).learnable_params();
    ASSERT_EQ(source.size(), target.size());
    for (int i = 0; i < source.size(); ++i) {
      ASSERT_EQ(source[i]->count(), target[i]->count());
      tmdlo_copy(source[i]->count(), source[i]->cpu_data(),
          target[i]->mutable_cpu_data());
    }
  }
  this->FillBatch(6);
  vector<Blob<Dtype>*> swapped_features;
  swapped_features.push_back(this->features_[1]);
  swapped_features.push_back(this->features_[0]);
  const Dtype loss = net.Forward(this->features_, this->label_);
  const Dtype swapped_loss = swapped.Forward(swapped_features, this->label_);
  EXPECT_NEAR(loss, swapped_loss, 1e-5);
  for (int n = 0; n < 6; ++n) {
    EXPECT_NEAR(net.sample_loss().cpu_data()[n],
        swapped.sample_loss().cpu_data()[n], 1e-5);
  }
}

TYPED_TEST(MultiViewNetTest, TestPredict) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(4);
  const Blob<Dtype>& evidence = net.Infer(this->features_);
  Blob<Dtype> prob;
  Blob<Dtype> uncertainty;
  const vector<int> predicted = net.Predict(&prob, &uncertainty);
  ASSERT_EQ(predicted.size(), 4);
  EXPECT_EQ(prob.shape(0), 4);
  EXPECT_EQ(prob.shape(1), 3);
  EXPECT_EQ(uncertainty.count(), 4);
  for (int n = 0; n < 4; ++n) {
    const Dtype* e = evidence.cpu_data() + n * 6;
    Dtype S = 3;
    for (int i = 0; i < 6; ++i) {
      S += e[i];
    }
    EXPECT_NEAR(Dtype(3) / S, uncertainty.cpu_data()[n], 1e-5);
    const Dtype* p = prob.cpu_data() + n * 3;
    Dtype sum = 0;
    for (int k = 0; k < 3; ++k) {
      EXPECT_NEAR((e[k] + e[3 + k] + 1) / S, p[k], 1e-5);
      EXPECT_LE(p[k], p[predicted[n]]);
      sum += p[k];
    }
    EXPECT_NEAR(Dtype(1), sum, 1e-5);
  }
}

TYPED_TEST(MultiViewNetTest, TestGradient) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(3);
  net.ClearParamDiffs();
  net.ForwardBackward(this->features_, this->label_);
  const vector<Blob<Dtype>*>& params = net.learnable_params();
  vector<vector<Dtype> > computed(params.size());
  for (int i = 0; i < params.size(); ++i) {
    computed[i].assign(params[i]->cpu_diff(),
        params[i]->cpu_diff() + params[i]->count());
  }
  const Dtype stepsize = 1e-2;
  const Dtype threshold = 1e-2;
  for (int i = 0; i < params.size(); ++i) {
    for (int j = 0; j < params[i]->count(); ++j) {
      Dtype* data = params[i]->mutable_cpu_data();
      data[j] += stepsize;
      const Dtype positive = net.Forward(this->features_, this->label_);
      data[j] -= 2 * stepsize;
      const Dtype negative = net.Forward(this->features_, this->label_);
      data[j] += stepsize;
      const Dtype estimated = (positive - negative) / stepsize / 2;
      const Dtype scale = std::max<Dtype>(
          std::max(std::fabs(computed[i][j]), std::fabs(estimated)),
          Dtype(1));
      EXPECT_NEAR(computed[i][j], estimated, threshold * scale)
          << "param " << i << ", element " << j;
    }
  }
}

TYPED_TEST(MultiViewNetTest, TestBackwardWithoutForward) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  EXPECT_DEATH(net.Backward(), "Backward needs a preceding Forward");
}

TYPED_TEST(MultiViewNetTest, TestBackwardAfterLargerInfer) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(2);
  net.Forward(this->features_, this->label_);
  this->FillBatch(5);
  net.Infer(this->features_);
  EXPECT_EQ(net.evidence().shape(0), 5);
  EXPECT_DEATH(net.Backward(), "Backward needs a preceding Forward");
}

TYPED_TEST(MultiViewNetTest, TestForwardAfterInferRestoresBackward) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(3);
  net.ClearParamDiffs();
  net.ForwardBackward(this->features_, this->label_);
  const vector<Blob<Dtype>*>& params = net.learnable_params();
  vector<vector<Dtype> > expected(params.size());
  for (int i = 0; i < params.size(); ++i) {
    expected[i].assign(params[i]->cpu_diff(),
        params[i]->cpu_diff() + params[i]->count());
  }
  vector<Blob<Dtype>*> larger;
  for (int v = 0; v < this->param_.view_size(); ++v) {
    vector<int> shape(2);
    shape[0] = 7;
    shape[1] = this->param_.view(v).dim(0);
    larger.push_back(new Blob<Dtype>(shape));
  }
  net.Infer(larger);
  net.ClearParamDiffs();
  net.ForwardBackward(this->features_, this->label_);
  for (int i = 0; i < params.size(); ++i) {
    for (int j = 0; j < params[i]->count(); ++j) {
      EXPECT_NEAR(expected[i][j], params[i]->cpu_diff()[j], 1e-5)
          << "param " << i << ", element " << j;
    }
  }
  for (int v = 0; v < larger.size(); ++v) {
    delete larger[v];
  }
}

TYPED_TEST(MultiViewNetTest, TestUpdateDecreasesLoss) {
  typedef TypeParam Dtype;
  MultiViewNet<Dtype> net(this->param_);
  this->FillBatch(6);
  Dtype previous = 0;
  for (int iter = 0; iter < 5; ++iter) {
    net.ClearParamDiffs();
    const Dtype loss = net.ForwardBackward(this->features_, this->label_);
    if (iter > 0) {
      EXPECT_LT(loss, previous);
    }
    previous = loss;
    for (int i = 0; i < net.learnable_params().size(); ++i) {
      net.learnable_params()[i]->scale_diff(Dtype(0.05));
    }
    net.Update();
  }
}

TYPED_TEST(MultiViewNetTest, TestHandwrittenModel) {
  typedef TypeParam Dtype;
  const string param_file = string(TMDLO_SOURCE_DIR)
      + "models/handwritten/tmdlo.prototxt";
  MultiViewNet<Dtype> net(param_file);
  ASSERT_EQ(net.num_views(), 6);
  EXPECT_EQ(net.num_classes(), 10);
  EXPECT_EQ(net.lambda_con(), Dtype(1));
  const int dims[6] = {240, 76, 216, 47, 64, 6};
  const char* names[6] = {"pix", "fou", "fac", "zer", "kar", "mor"};
  for (int v = 0; v < 6; ++v) {
    EXPECT_EQ(net.encoder(v).name(), names[v]);
    EXPECT_EQ(net.encoder(v).input_dim(), dims[v]);
    EXPECT_EQ(net.encoder(v).num_affine_layers(), 1);
  }
  vector<Blob<Dtype>*> features;
  FillerParameter filler_param;
  filler_param.set_min(0);
  filler_param.set_max(1);
  UniformFiller<Dtype> filler(filler_param);
  for (int v = 0; v < 6; ++v) {
    vector<int> shape(2);
    shape[0] = 2;
    shape[1] = dims[v];
    features.push_back(new Blob<Dtype>(shape));
    filler.Fill(features.back());
  }
  Blob<Dtype> label(vector<int>(1, 2));
  label.mutable_cpu_data()[0] = 3;
  label.mutable_cpu_data()[1] = 9;
  const Dtype loss = net.Forward(features, &label);
  EXPECT_TRUE(std::isfinite(loss));
  EXPECT_GT(loss, Dtype(0));
  EXPECT_EQ(net.evidence().shape(1), 6);
  EXPECT_EQ(net.evidence().shape(2), 10);
  for (int v = 0; v < 6; ++v) {
    delete features[v];
  }
}

}  // namespace tmdlo
