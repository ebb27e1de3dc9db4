#include "adapters/registry.hpp"

#include <iostream>
#include <utility>

namespace gateway {

std::unique_ptr<ModelRegistry> ModelRegistry::Create(std::vector<std::unique_ptr<ModelAdapter>> adapters,
                                                     std::string* err) {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::unique_ptr<ModelAdapter>> by_id;
  for (auto& adapter : adapters) {
    if (!adapter) {
      if (err) *err = "registry: null adapter";
      return nullptr;
    }
    const std::string id = adapter->Id();
    if (id.empty()) {
      if (err) *err = "registry: adapter with empty id";
      return nullptr;
    }
    if (by_id.count(id) != 0) {
      if (err) *err = "registry: duplicate model id " + id;
      return nullptr;
    }
    std::cout << "[registry] model=" << id << " vendor=" << adapter->Vendor()
              << " upstream=" << adapter->Config().model_name << "\n";
    order.push_back(id);
    by_id.emplace(id, std::move(adapter));
  }
  return std::make_unique<ModelRegistry>(Key{}, std::move(order), std::move(by_id));
}

ModelAdapter* ModelRegistry::Resolve(const std::string& id, GatewayError* err) const {
  auto it = adapters_.find(id);
  if (it == adapters_.end()) {
    SetError(err, ErrorKind::kUnknownModel, "model " + id + " not found");
    return nullptr;
  }
  return it->second.get();
}

}  // namespace gateway
