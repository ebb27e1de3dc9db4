#pragma once

#include "adapters/adapter.hpp"
#include "adapters/registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gateway {

// Vendors: "openai" (aliases "openai_compatible", "volcengine", "deepseek"),
// "anthropic", "ollama". Returns nullptr for anything else.
std::unique_ptr<ModelAdapter> CreateAdapter(const BackendConfig& config,
                                            std::shared_ptr<IHttpTransport> transport,
                                            std::string* err);

std::unique_ptr<ModelRegistry> BuildRegistry(const std::vector<BackendConfig>& configs,
                                             const std::shared_ptr<IHttpTransport>& transport,
                                             std::string* err);

}  // namespace gateway
