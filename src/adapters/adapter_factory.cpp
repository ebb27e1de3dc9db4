#include "adapters/adapter_factory.hpp"

#include "anthropic_adapter.hpp"
#include "ollama_adapter.hpp"
#include "openai_compatible_adapter.hpp"

#include <utility>

namespace gateway {

std::unique_ptr<ModelAdapter> CreateAdapter(const BackendConfig& config,
                                            std::shared_ptr<IHttpTransport> transport,
                                            std::string* err) {
  if (!transport) {
    if (err) *err = "model " + config.id + ": no transport";
    return nullptr;
  }
  const auto& v = config.vendor;
  if (v == "openai" || v == "openai_compatible" || v == "volcengine" || v == "deepseek") {
    return std::make_unique<OpenAiCompatibleAdapter>(config, std::move(transport));
  }
  if (v == "anthropic") {
    return std::make_unique<AnthropicAdapter>(config, std::move(transport));
  }
  if (v == "ollama") {
    return std::make_unique<OllamaAdapter>(config, std::move(transport));
  }
  if (err) *err = "model " + config.id + ": unknown vendor " + v;
  return nullptr;
}

std::unique_ptr<ModelRegistry> BuildRegistry(const std::vector<BackendConfig>& configs,
                                             const std::shared_ptr<IHttpTransport>& transport,
                                             std::string* err) {
  std::vector<std::unique_ptr<ModelAdapter>> adapters;
  adapters.reserve(configs.size());
  for (const auto& cfg : configs) {
    auto adapter = CreateAdapter(cfg, transport, err);
    if (!adapter) return nullptr;
    adapters.push_back(std::move(adapter));
  }
  return ModelRegistry::Create(std::move(adapters), err);
}

}  // namespace gateway
