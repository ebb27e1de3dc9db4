#pragma once

#include "adapters/adapter.hpp"

#include <nlohmann/json.hpp>

namespace gateway {

class OllamaAdapter : public ModelAdapter {
 public:
  OllamaAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport);

  std::string Vendor() const override;

 protected:
  std::optional<std::string> ChatOnce(const std::vector<ChatTurn>& turns,
                                      const CallContext& ctx,
                                      GatewayError* err) override;
  bool ChatStream(const std::vector<ChatTurn>& turns,
                  const CallContext& ctx,
                  const DeltaCallback& on_delta,
                  GatewayError* err) override;

 private:
  nlohmann::json BuildBody(const std::vector<ChatTurn>& turns, bool stream) const;
  RequestHeaderList Headers() const;
};

}  // namespace gateway
