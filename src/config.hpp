#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

struct HttpListenConfig {
  std::string host = "127.0.0.1";
  int port = 8088;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

struct BackendConfig {
  std::string id;
  std::string vendor = "openai";
  std::string endpoint;
  HttpEndpoint http;
  std::string api_key;
  std::string model_name;
  std::optional<int> timeout_ms;
  std::optional<int> max_tokens;
};

struct GatewayConfig {
  HttpListenConfig listen;
  int default_timeout_ms = 30000;
  std::vector<BackendConfig> models;
};

HttpEndpoint ParseHttpEndpoint(const std::string& url);

// Accepts either an array of model objects or an object keyed by identifier.
// Order of appearance is kept.
std::optional<std::vector<BackendConfig>> ParseBackendConfigs(const std::string& json_text, std::string* err);

std::optional<GatewayConfig> LoadConfigFromEnv(std::string* err);

using RequestHeaderList = std::vector<std::pair<std::string, std::string>>;

}  // namespace gateway
