#include "config.hpp"

#include <httplib.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace ollama_client {
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

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
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
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

ClientConfig LoadConfigFromEnv() {
  ClientConfig cfg;

  if (auto host = GetEnvStr("OLLAMA_HOST"); !host.empty()) cfg.endpoint = ParseHttpEndpoint(host, 11434);
  if (auto timeout = GetEnvStr("OLLAMA_REQUEST_TIMEOUT"); !timeout.empty()) {
    const int seconds = std::atoi(timeout.c_str());
    if (seconds > 0) cfg.request_timeout_seconds = seconds;
  }
  if (auto verbose = GetEnvStr("OLLAMA_VERBOSE"); !verbose.empty()) {
    bool b = true;
    if (TryParseBool(verbose, &b)) cfg.verbose = b;
  }
  if (auto user = GetEnvStr("OLLAMA_BASIC_AUTH_USER"); !user.empty()) {
    cfg.basic_auth = BasicAuth{user, GetEnvStr("OLLAMA_BASIC_AUTH_PASSWORD")};
  }

  return cfg;
}

EndpointDescriptor MakeDescriptor(const ClientConfig& cfg, std::string path, std::string method) {
  EndpointDescriptor d;
  d.endpoint = cfg.endpoint;
  d.path = std::move(path);
  d.method = std::move(method);
  d.basic_auth = cfg.basic_auth;
  d.timeout_seconds = cfg.request_timeout_seconds;
  d.verbose = cfg.verbose;
  return d;
}

RequestHeaderList BuildRequestHeaders(const EndpointDescriptor& descriptor) {
  RequestHeaderList headers;
  headers.emplace_back("Content-Type", "application/json");
  if (descriptor.basic_auth.has_value()) {
    headers.push_back(
        httplib::make_basic_authentication_header(descriptor.basic_auth->username, descriptor.basic_auth->password));
  }
  return headers;
}

std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

}  // namespace ollama_client
