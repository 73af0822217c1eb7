#include "tmdlo/layer.hpp"
#include "tmdlo/layer_factory.hpp"

namespace tmdlo
{

template<typename T>
typename LayerRegistry<T>::CreatorRegistry & LayerRegistry<T>::Registry()
{
  static LayerRegistry<T>::CreatorRegistry * g_registry_ = new LayerRegistry<T>::CreatorRegistry();
  return *g_registry_;
}

template LayerRegistry<float>::CreatorRegistry & LayerRegistry<float>::Registry();
template LayerRegistry<double>::CreatorRegistry & LayerRegistry<double>::Registry();

}
