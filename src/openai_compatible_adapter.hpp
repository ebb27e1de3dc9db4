#pragma once

#include "adapters/adapter.hpp"

#include <string>

namespace gateway {

// OpenAI style /chat/completions. Also serves VolcEngine Ark and DeepSeek,
// whose endpoints include the version segment (".../api/v3", ".../v1").
class OpenAiCompatibleAdapter : public ModelAdapter {
 public:
  OpenAiCompatibleAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport);

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
