#pragma once

#include "dispatcher.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gateway {

// SSE payload for one tagged chunk.
nlohmann::json ChunkToJson(const ResultChunk& chunk);

nlohmann::json ErrorToJson(const GatewayError& err);

// Reads [{"role", "content"}, ...]. Content given as an array of text parts
// is joined. Role names are checked later by the dispatcher.
std::optional<std::vector<ChatTurn>> ParseTurns(const nlohmann::json& messages, std::string* err);

class GatewayRouter {
 public:
  explicit GatewayRouter(Dispatcher* dispatcher);
  void Register(httplib::Server* server);

 private:
  Dispatcher* dispatcher_;
};

}  // namespace gateway
