#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace gateway {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool ParsePositiveInt(const std::string& s, int* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || n <= 0 || n > 0x7fffffff) return false;
  *out = static_cast<int>(n);
  return true;
}

static std::optional<std::string> GetString(const nlohmann::ordered_json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
  return j[key].get<std::string>();
}

static bool ReadPositiveNumber(const nlohmann::ordered_json& j,
                               const char* key,
                               double scale,
                               std::optional<int>* out,
                               std::string* err,
                               const std::string& id) {
  if (!j.contains(key)) return true;
  const auto& v = j[key];
  if (!v.is_number()) {
    if (err) *err = "model " + id + ": " + key + " must be a number";
    return false;
  }
  const double d = v.get<double>() * scale;
  if (d <= 0 || d > 0x7fffffff) {
    if (err) *err = "model " + id + ": " + key + " must be positive";
    return false;
  }
  *out = static_cast<int>(d);
  return true;
}

static bool ParseOneBackend(const std::string& id,
                            const nlohmann::ordered_json& j,
                            BackendConfig* out,
                            std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "model " + id + ": expected an object";
    return false;
  }
  if (id.empty()) {
    if (err) *err = "model entry without id";
    return false;
  }
  BackendConfig cfg;
  cfg.id = id;
  if (auto v = GetString(j, "vendor")) cfg.vendor = ToLower(*v);

  auto endpoint = GetString(j, "endpoint");
  if (!endpoint) endpoint = GetString(j, "base_url");
  if (!endpoint || endpoint->empty()) {
    if (err) *err = "model " + id + ": missing endpoint";
    return false;
  }
  cfg.endpoint = *endpoint;
  cfg.http = ParseHttpEndpoint(cfg.endpoint);

  auto model_name = GetString(j, "model_name");
  if (!model_name || model_name->empty()) {
    if (err) *err = "model " + id + ": missing model_name";
    return false;
  }
  cfg.model_name = *model_name;

  if (auto key = GetString(j, "api_key")) cfg.api_key = *key;
  if (auto env_name = GetString(j, "api_key_env"); env_name && !env_name->empty()) {
    if (auto from_env = GetEnvStr(env_name->c_str()); !from_env.empty()) cfg.api_key = from_env;
  }

  if (!ReadPositiveNumber(j, "timeout_ms", 1.0, &cfg.timeout_ms, err, id)) return false;
  if (!cfg.timeout_ms && !ReadPositiveNumber(j, "timeout", 1000.0, &cfg.timeout_ms, err, id)) return false;
  if (!ReadPositiveNumber(j, "max_tokens", 1.0, &cfg.max_tokens, err, id)) return false;

  *out = std::move(cfg);
  return true;
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  } else {
    ep.scheme = "https";
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = ep.scheme == "https" ? 443 : 80;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::optional<std::vector<BackendConfig>> ParseBackendConfigs(const std::string& json_text, std::string* err) {
  auto j = nlohmann::ordered_json::parse(json_text, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "models config: invalid json";
    return std::nullopt;
  }
  if (j.is_object() && j.contains("models")) j = j["models"];

  std::vector<BackendConfig> out;
  std::unordered_set<std::string> seen;
  auto add = [&](const std::string& id, const nlohmann::ordered_json& item) -> bool {
    BackendConfig cfg;
    if (!ParseOneBackend(id, item, &cfg, err)) return false;
    if (!seen.insert(cfg.id).second) {
      if (err) *err = "models config: duplicate model id " + cfg.id;
      return false;
    }
    out.push_back(std::move(cfg));
    return true;
  };

  if (j.is_array()) {
    for (const auto& item : j) {
      std::string id;
      if (item.is_object()) {
        if (auto v = GetString(item, "id")) id = *v;
      }
      if (!add(id, item)) return std::nullopt;
    }
  } else if (j.is_object()) {
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (!add(it.key(), it.value())) return std::nullopt;
    }
  } else {
    if (err) *err = "models config: expected an array or an object";
    return std::nullopt;
  }
  return out;
}

std::optional<GatewayConfig> LoadConfigFromEnv(std::string* err) {
  GatewayConfig cfg;

  if (auto host = GetEnvStr("LLM_GATEWAY_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("LLM_GATEWAY_LISTEN_PORT"); !port.empty()) {
    if (!ParsePositiveInt(port, &cfg.listen.port)) {
      if (err) *err = "LLM_GATEWAY_LISTEN_PORT: not a positive integer";
      return std::nullopt;
    }
  }
  if (auto t = GetEnvStr("LLM_GATEWAY_TIMEOUT_MS"); !t.empty()) {
    if (!ParsePositiveInt(t, &cfg.default_timeout_ms)) {
      if (err) *err = "LLM_GATEWAY_TIMEOUT_MS: not a positive integer";
      return std::nullopt;
    }
  }

  std::string models_json = GetEnvStr("LLM_GATEWAY_MODELS");
  if (models_json.empty()) {
    auto path = GetEnvStr("LLM_GATEWAY_MODELS_FILE");
    if (path.empty()) path = "config/models.json";
    auto text = ReadFile(path);
    if (!text) {
      if (err) *err = "cannot read models config: " + path;
      return std::nullopt;
    }
    models_json = std::move(*text);
  }

  auto models = ParseBackendConfigs(models_json, err);
  if (!models) return std::nullopt;
  cfg.models = std::move(*models);
  return cfg;
}

}  // namespace gateway
