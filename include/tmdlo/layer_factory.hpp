/**
 * @brief A layer factory that allows one to register layers.
 * During runtime, registered layers can be called by passing a LayerParameter
 * protobuffer to the CreateLayer function:
 *
 *     LayerRegistry<Dtype>::CreateLayer(param);
 *
 * A layer class FooLayer is registered under the type "Foo" by adding
 *
 *    REGISTER_LAYER_CLASS(Foo);
 *
 * to its source file, after INSTANTIATE_CLASS. Each layer type is registered
 * once.
 */

#ifndef TMDLO_LAYER_FACTORY_H_
#define TMDLO_LAYER_FACTORY_H_

#include <map>
#include <string>
#include <vector>

#include "tmdlo/common.hpp"
#include "tmdlo/proto/tmdlo.pb.h"

namespace tmdlo {

template <typename Dtype>
class Layer;

template <typename Dtype>
class LayerRegistry {
 public:
  typedef shared_ptr<Layer<Dtype> > (*Creator)(const LayerParameter&);
  typedef std::map<string, Creator> CreatorRegistry;

  static CreatorRegistry& Registry();

  // Adds a creator.
  static void AddCreator(const string& type, Creator creator) {
    CreatorRegistry& registry = Registry();
    CHECK_EQ(registry.count(type), 0)
        << "Layer type " << type << " already registered.";
    registry[type] = creator;
  }

  // Get a layer using a LayerParameter.
  static shared_ptr<Layer<Dtype> > CreateLayer(const LayerParameter& param) {
    LOG(INFO) << "Creating layer " << param.name();
    const string& type = param.type();
    CreatorRegistry& registry = Registry();
    CHECK_EQ(registry.count(type), 1) << "Unknown layer type: " << type
        << " (known types: " << LayerTypeListString() << ")";
    return registry[type](param);
  }

  static vector<string> LayerTypeList() {
    CreatorRegistry& registry = Registry();
    vector<string> layer_types;
    for (typename CreatorRegistry::iterator iter = registry.begin();
         iter != registry.end(); ++iter) {
      layer_types.push_back(iter->first);
    }
    return layer_types;
  }

 private:
  // Layer registry should never be instantiated - everything is done with its
  // static variables.
  LayerRegistry() {}

  static string LayerTypeListString() {
    vector<string> layer_types = LayerTypeList();
    string layer_types_str;
    for (vector<string>::iterator iter = layer_types.begin();
         iter != layer_types.end(); ++iter) {
      if (iter != layer_types.begin()) {
        layer_types_str += ", ";
      }
      layer_types_str += *iter;
    }
    return layer_types_str;
  }
};


template <typename Dtype>
class LayerRegisterer {
 public:
  LayerRegisterer(const string& type,
                  shared_ptr<Layer<Dtype> > (*creator)(const LayerParameter&)) {
    LayerRegistry<Dtype>::AddCreator(type, creator);
  }
};

template<typename Dtype, typename LayerType>
shared_ptr<Layer<Dtype> > GeneralLayerCreator(const LayerParameter& param)
{
  return shared_ptr<Layer<Dtype> >(new LayerType(param));
}


#define REGISTER_LAYER_CLASS(type)                                             \
  static LayerRegisterer<float> g_creator_f_##type(#type,                      \
      GeneralLayerCreator<float, type##Layer<float> >);                        \
  static LayerRegisterer<double> g_creator_d_##type(#type,                     \
      GeneralLayerCreator<double, type##Layer<double> >)

}  // namespace tmdlo

#endif  // TMDLO_LAYER_FACTORY_H_
