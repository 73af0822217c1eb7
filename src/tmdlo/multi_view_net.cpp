#include <boost/pointer_cast.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "tmdlo/layers/dirichlet_consistency_loss_layer.hpp"
#include "tmdlo/multi_view_net.hpp"
#include "tmdlo/util/dirichlet.hpp"
#include "tmdlo/util/io.hpp"
#include "tmdlo/util/math_functions.hpp"

namespace tmdlo {

template <typename Dtype>
MultiViewNet<Dtype>::MultiViewNet(const MultiViewNetParameter& param)
    : label_(NULL) {
  Init(param);
}

template <typename Dtype>
MultiViewNet<Dtype>::MultiViewNet(const string& param_file)
    : label_(NULL) {
  MultiViewNetParameter param;
  ReadMultiViewNetParamsFromTextFileOrDie(param_file, &param);
  Init(param);
}

template <typename Dtype>
void MultiViewNet<Dtype>::Init(const MultiViewNetParameter& param) {
  name_ = param.name();
  num_classes_ = param.num_classes();
  lambda_con_ = param.lambda_con();
  const int num_views = param.view_size();
  CHECK_GE(num_classes_, 2) << "num_classes must be at least 2";
  CHECK_GE(num_views, 2)
      << "at least two views are needed to measure their consistency";
  CHECK_GE(lambda_con_, 0) << "lambda_con must be non-negative";
  LOG(INFO) << "Initializing net " << name_ << " with " << num_views
            << " views and " << num_classes_ << " classes";

  FillerParameter weight_filler = param.weight_filler();
  if (!param.has_weight_filler()) {
    weight_filler.set_type("xavier");
  }
  encoders_.clear();
  view_evidence_.clear();
  view_evidence_vecs_.clear();
  learnable_params_.clear();
  for (int v = 0; v < num_views; ++v) {
    ViewParameter view = param.view(v);
    if (!view.has_name()) {
      std::ostringstream view_name;
      view_name << "view" << v;
      view.set_name(view_name.str());
    }
    LOG(INFO) << "Creating evidence encoder for " << view.name();
    shared_ptr<EvidenceEncoder<Dtype> > encoder(new EvidenceEncoder<Dtype>(
        view, num_classes_, weight_filler, param.bias_filler(),
        param.softplus_param()));
    const vector<Blob<Dtype>*>& params = encoder->learnable_params();
    learnable_params_.insert(learnable_params_.end(), params.begin(),
        params.end());
    encoders_.push_back(encoder);
    vector<int> evidence_shape(2);
    evidence_shape[0] = 1;
    evidence_shape[1] = num_classes_;
    view_evidence_.push_back(shared_ptr<Blob<Dtype> >(
        new Blob<Dtype>(evidence_shape)));
    view_evidence_vecs_.push_back(view_evidence_.back().get());
  }

  LayerParameter stack_param;
  stack_param.set_name("evidence");
  stack_param.set_type("EvidenceStack");
  stack_param.mutable_evidence_stack_param()->set_num_classes(num_classes_);
  stack_layer_ = LayerRegistry<Dtype>::CreateLayer(stack_param);
  stack_layer_->SetUp(view_evidence_vecs_,
      vector<Blob<Dtype>*>(1, &evidence_));

  Blob<Dtype> label_placeholder(vector<int>(1, 1));
  vector<Blob<Dtype>*> accuracy_bottom;
  accuracy_bottom.push_back(&evidence_);
  accuracy_bottom.push_back(&label_placeholder);
  vector<Blob<Dtype>*> accuracy_top;
  accuracy_top.push_back(&accuracy_loss_);
  accuracy_top.push_back(&accuracy_sample_loss_);
  LayerParameter accuracy_param;
  accuracy_param.set_name("accuracy_loss");
  accuracy_param.set_type("DirichletAccuracyLoss");
  accuracy_param.add_loss_weight(1);
  accuracy_param.add_loss_weight(0);
  accuracy_param.mutable_loss_param()->CopyFrom(param.loss_param());
  accuracy_param.mutable_dirichlet_param()->set_num_classes(num_classes_);
  accuracy_layer_ = LayerRegistry<Dtype>::CreateLayer(accuracy_param);
  accuracy_layer_->SetUp(accuracy_bottom, accuracy_top);

  consistency_evidence_.ReshapeLike(evidence_);
  consistency_evidence_.ShareData(evidence_);
  vector<Blob<Dtype>*> consistency_top;
  consistency_top.push_back(&consistency_loss_);
  consistency_top.push_back(&consistency_sample_loss_);
  LayerParameter consistency_param;
  consistency_param.set_name("consistency_loss");
  consistency_param.set_type("DirichletConsistencyLoss");
  consistency_param.add_loss_weight(lambda_con_);
  consistency_param.add_loss_weight(0);
  consistency_param.mutable_loss_param()->CopyFrom(param.loss_param());
  DirichletParameter* dirichlet_param =
      consistency_param.mutable_dirichlet_param();
  dirichlet_param->set_num_classes(num_classes_);
  for (int k = 0; k < param.prior_size(); ++k) {
    dirichlet_param->add_prior(param.prior(k));
  }
  consistency_layer_ = LayerRegistry<Dtype>::CreateLayer(consistency_param);
  consistency_layer_->SetUp(
      vector<Blob<Dtype>*>(1, &consistency_evidence_), consistency_top);

  LOG(INFO) << "Net " << name_ << " has " << learnable_params_.size()
            << " learnable parameter blobs, lambda_con = " << lambda_con_;
}

template <typename Dtype>
void MultiViewNet<Dtype>::CheckFeatures(
    const vector<Blob<Dtype>*>& features) const {
  CHECK_EQ(features.size(), encoders_.size())
      << "expected features for " << encoders_.size() << " views, got "
      << features.size();
  for (int v = 1; v < features.size(); ++v) {
    CHECK_EQ(features[v]->shape(0), features[0]->shape(0))
        << "view " << encoders_[v]->name()
        << " has a different number of samples than "
        << encoders_[0]->name();
  }
}

template <typename Dtype>
const Blob<Dtype>& MultiViewNet<Dtype>::Infer(
    const vector<Blob<Dtype>*>& features) {
  CheckFeatures(features);
  for (int v = 0; v < encoders_.size(); ++v) {
    encoders_[v]->Forward(features[v], view_evidence_[v].get());
  }
  stack_layer_->Forward(view_evidence_vecs_,
      vector<Blob<Dtype>*>(1, &evidence_));
  features_ = features;
  // The losses of an earlier Forward no longer match this evidence.
  label_ = NULL;
  DLOG(INFO) << "Evidence " << evidence_.shape_string()
             << ", total " << evidence_.asum_data();
  return evidence_;
}

template <typename Dtype>
Dtype MultiViewNet<Dtype>::Forward(const vector<Blob<Dtype>*>& features,
    Blob<Dtype>* label) {
  CHECK(label) << "Forward needs labels; use Infer for evidence only";
  Infer(features);
  label_ = label;

  vector<Blob<Dtype>*> accuracy_bottom;
  accuracy_bottom.push_back(&evidence_);
  accuracy_bottom.push_back(label);
  vector<Blob<Dtype>*> accuracy_top;
  accuracy_top.push_back(&accuracy_loss_);
  accuracy_top.push_back(&accuracy_sample_loss_);
  Dtype loss = accuracy_layer_->Forward(accuracy_bottom, accuracy_top);

  consistency_evidence_.ReshapeLike(evidence_);
  consistency_evidence_.ShareData(evidence_);
  vector<Blob<Dtype>*> consistency_top;
  consistency_top.push_back(&consistency_loss_);
  consistency_top.push_back(&consistency_sample_loss_);
  loss += consistency_layer_->Forward(
      vector<Blob<Dtype>*>(1, &consistency_evidence_), consistency_top);

  const int num = evidence_.shape(0);
  sample_loss_.Reshape(vector<int>(1, num));
  tmdlo_copy(num, accuracy_sample_loss_.cpu_data(),
      sample_loss_.mutable_cpu_data());
  tmdlo_axpy(num, lambda_con_, consistency_sample_loss_.cpu_data(),
      sample_loss_.mutable_cpu_data());
  DLOG(INFO) << "L_acc = " << accuracy_loss() << ", L_con = "
             << consistency_loss() << ", loss = " << loss;
  return loss;
}

template <typename Dtype>
void MultiViewNet<Dtype>::Backward() {
  CHECK(label_) << "Backward needs a preceding Forward on the same batch";
  vector<Blob<Dtype>*> accuracy_bottom;
  accuracy_bottom.push_back(&evidence_);
  accuracy_bottom.push_back(label_);
  vector<Blob<Dtype>*> accuracy_top;
  accuracy_top.push_back(&accuracy_loss_);
  accuracy_top.push_back(&accuracy_sample_loss_);
  vector<bool> accuracy_propagate(2, false);
  accuracy_propagate[0] = true;
  accuracy_layer_->Backward(accuracy_top, accuracy_propagate,
      accuracy_bottom);

  vector<Blob<Dtype>*> consistency_top;
  consistency_top.push_back(&consistency_loss_);
  consistency_top.push_back(&consistency_sample_loss_);
  consistency_layer_->Backward(consistency_top, vector<bool>(1, true),
      vector<Blob<Dtype>*>(1, &consistency_evidence_));
  // Both losses read the same evidence; their gradients add up.
  CHECK_EQ(consistency_evidence_.count(), evidence_.count())
      << "consistency loss was computed on a different batch";
  tmdlo_axpy(evidence_.count(), Dtype(1), consistency_evidence_.cpu_diff(),
      evidence_.mutable_cpu_diff());

  stack_layer_->Backward(vector<Blob<Dtype>*>(1, &evidence_),
      vector<bool>(encoders_.size(), true), view_evidence_vecs_);
  for (int v = 0; v < encoders_.size(); ++v) {
    encoders_[v]->Backward(features_[v], view_evidence_[v].get());
  }
}

template <typename Dtype>
vector<int> MultiViewNet<Dtype>::Predict(Blob<Dtype>* prob,
    Blob<Dtype>* uncertainty) const {
  const int num = evidence_.shape(0);
  const int views = evidence_.shape(1);
  vector<int> prob_shape(2);
  prob_shape[0] = num;
  prob_shape[1] = num_classes_;
  prob->Reshape(prob_shape);
  uncertainty->Reshape(vector<int>(1, num));
  const Dtype* evidence = evidence_.cpu_data();
  Dtype* prob_data = prob->mutable_cpu_data();
  Dtype* uncertainty_data = uncertainty->mutable_cpu_data();
  vector<int> predicted(num);
  for (int n = 0; n < num; ++n) {
    Dtype* p = prob_data + n * num_classes_;
    const Dtype S = fused_prediction(views, num_classes_,
        evidence + n * views * num_classes_, p);
    uncertainty_data[n] = Dtype(num_classes_) / S;
    predicted[n] = std::max_element(p, p + num_classes_) - p;
  }
  return predicted;
}

template <typename Dtype>
void MultiViewNet<Dtype>::ClearParamDiffs() {
  for (int i = 0; i < learnable_params_.size(); ++i) {
    Blob<Dtype>* blob = learnable_params_[i];
    tmdlo_set(blob->count(), static_cast<Dtype>(0),
              blob->mutable_cpu_diff());
  }
}

template <typename Dtype>
void MultiViewNet<Dtype>::Update() {
  for (int i = 0; i < learnable_params_.size(); ++i) {
    learnable_params_[i]->Update();
  }
}

template <typename Dtype>
const Blob<Dtype>& MultiViewNet<Dtype>::prior() const {
  shared_ptr<DirichletConsistencyLossLayer<Dtype> > layer =
      boost::dynamic_pointer_cast<DirichletConsistencyLossLayer<Dtype> >(
          consistency_layer_);
  CHECK(layer) << "consistency layer has unexpected type "
               << consistency_layer_->type();
  return layer->prior();
}

INSTANTIATE_CLASS(MultiViewNet);

}  // namespace tmdlo
