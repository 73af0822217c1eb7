#include <sstream>
#include <string>
#include <vector>

#include "tmdlo/evidence_encoder.hpp"

namespace tmdlo {

template <typename Dtype>
EvidenceEncoder<Dtype>::EvidenceEncoder(const ViewParameter& view,
    const int num_classes, const FillerParameter& weight_filler,
    const FillerParameter& bias_filler,
    const SoftplusParameter& softplus_param)
    : name_(view.name()), num_classes_(num_classes) {
  CHECK_GE(view.dim_size(), 1)
      << "view " << name_ << " needs at least its input dimension";
  CHECK_GT(num_classes_, 0) << "view " << name_ << " needs classes";
  for (int i = 0; i < view.dim_size(); ++i) {
    CHECK_GT(view.dim(i), 0)
        << "dimension " << i << " of view " << name_ << " must be positive";
  }
  input_dim_ = view.dim(0);

  // One affine layer per configured dimension; the last maps to the classes.
  vector<int> input_shape(2);
  input_shape[0] = 1;
  input_shape[1] = input_dim_;
  Blob<Dtype> input(input_shape);
  Blob<Dtype>* bottom = &input;
  for (int i = 0; i < view.dim_size(); ++i) {
    const int num_output =
        (i + 1 < view.dim_size()) ? view.dim(i + 1) : num_classes_;
    LayerParameter layer_param;
    std::ostringstream layer_name;
    layer_name << name_ << "/fc" << i;
    layer_param.set_name(layer_name.str());
    layer_param.set_type("InnerProduct");
    InnerProductParameter* inner_product_param =
        layer_param.mutable_inner_product_param();
    inner_product_param->set_num_output(num_output);
    inner_product_param->mutable_weight_filler()->CopyFrom(weight_filler);
    inner_product_param->mutable_bias_filler()->CopyFrom(bias_filler);

    shared_ptr<Layer<Dtype> > layer =
        LayerRegistry<Dtype>::CreateLayer(layer_param);
    shared_ptr<Blob<Dtype> > top(new Blob<Dtype>());
    layer->SetUp(vector<Blob<Dtype>*>(1, bottom),
        vector<Blob<Dtype>*>(1, top.get()));
    LOG(INFO) << layer_param.name() << ": " << bottom->shape(1) << " -> "
              << num_output;
    for (int j = 0; j < layer->blobs().size(); ++j) {
      learnable_params_.push_back(layer->blobs()[j].get());
    }
    affine_layers_.push_back(layer);
    affine_tops_.push_back(top);
    bottom = top.get();
  }

  LayerParameter activation_param;
  activation_param.set_name(name_ + "/evidence");
  activation_param.set_type("Softplus");
  activation_param.mutable_softplus_param()->CopyFrom(softplus_param);
  activation_ = LayerRegistry<Dtype>::CreateLayer(activation_param);
  Blob<Dtype> evidence;
  activation_->SetUp(vector<Blob<Dtype>*>(1, bottom),
      vector<Blob<Dtype>*>(1, &evidence));
}

template <typename Dtype>
void EvidenceEncoder<Dtype>::Forward(Blob<Dtype>* features,
    Blob<Dtype>* evidence) {
  CHECK_EQ(features->num_axes(), 2)
      << "features of view " << name_ << " must be N x " << input_dim_
      << ", got " << features->shape_string();
  CHECK_EQ(features->shape(1), input_dim_)
      << "view " << name_ << " expects " << input_dim_
      << " features per sample, got " << features->shape(1);
  Blob<Dtype>* bottom = features;
  for (int i = 0; i < affine_layers_.size(); ++i) {
    affine_layers_[i]->Forward(vector<Blob<Dtype>*>(1, bottom),
        vector<Blob<Dtype>*>(1, affine_tops_[i].get()));
    bottom = affine_tops_[i].get();
  }
  activation_->Forward(vector<Blob<Dtype>*>(1, bottom),
      vector<Blob<Dtype>*>(1, evidence));
}

template <typename Dtype>
void EvidenceEncoder<Dtype>::Backward(Blob<Dtype>* features,
    Blob<Dtype>* evidence) {
  activation_->Backward(vector<Blob<Dtype>*>(1, evidence),
      vector<bool>(1, true),
      vector<Blob<Dtype>*>(1, affine_tops_.back().get()));
  for (int i = affine_layers_.size() - 1; i >= 0; --i) {
    Blob<Dtype>* bottom = (i == 0) ? features : affine_tops_[i - 1].get();
    affine_layers_[i]->Backward(
        vector<Blob<Dtype>*>(1, affine_tops_[i].get()),
        vector<bool>(1, i > 0), vector<Blob<Dtype>*>(1, bottom));
  }
}

INSTANTIATE_CLASS(EvidenceEncoder);

}  // namespace tmdlo
