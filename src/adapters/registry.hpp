#pragma once

#include "adapters/adapter.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gateway {

// Identifier -> adapter. Built once at startup and never mutated, so lookups
// need no locking.
class ModelRegistry {
 public:
  // Fails on a null adapter, an empty id or a duplicate id.
  static std::unique_ptr<ModelRegistry> Create(std::vector<std::unique_ptr<ModelAdapter>> adapters, std::string* err);

  ModelRegistry(const ModelRegistry&) = delete;
  ModelRegistry& operator=(const ModelRegistry&) = delete;

  // nullptr and kUnknownModel when the id is not registered.
  ModelAdapter* Resolve(const std::string& id, GatewayError* err) const;

  // Insertion order.
  const std::vector<std::string>& List() const { return order_; }

  size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

 private:
  // Limits construction to Create.
  struct Key {
    explicit Key() = default;
  };

 public:
  ModelRegistry(Key,
                std::vector<std::string> order,
                std::unordered_map<std::string, std::unique_ptr<ModelAdapter>> adapters)
      : order_(std::move(order)), adapters_(std::move(adapters)) {}

 private:
  std::vector<std::string> order_;
  std::unordered_map<std::string, std::unique_ptr<ModelAdapter>> adapters_;
};

}  // namespace gateway
