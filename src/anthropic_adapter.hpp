#pragma once

#include "adapters/adapter.hpp"

#include <string>

namespace gateway {

// Anthropic Messages API. System turns are folded into the top-level
// "system" field; the endpoint is expected to end with the version ("/v1").
class AnthropicAdapter : public ModelAdapter {
 public:
  AnthropicAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport);

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
  std::string BuildBody(const std::vector<ChatTurn>& turns, bool stream) const;
  RequestHeaderList Headers() const;
};

}  // namespace gateway
