#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ollama_client {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

struct BasicAuth {
  std::string username;
  std::string password;
};

struct ClientConfig {
  HttpEndpoint endpoint;
  int request_timeout_seconds = 10;
  bool verbose = true;
  std::optional<BasicAuth> basic_auth;
};

// Identifies what a single call targets. Immutable for the lifetime of one call.
struct EndpointDescriptor {
  HttpEndpoint endpoint;
  std::string path;
  std::string method = "POST";
  std::optional<BasicAuth> basic_auth;
  int timeout_seconds = 10;
  bool verbose = false;
};

using RequestHeaderList = std::vector<std::pair<std::string, std::string>>;

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
ClientConfig LoadConfigFromEnv();

EndpointDescriptor MakeDescriptor(const ClientConfig& cfg, std::string path, std::string method = "POST");
RequestHeaderList BuildRequestHeaders(const EndpointDescriptor& descriptor);
std::string JoinPath(const std::string& base, const std::string& path);

}  // namespace ollama_client
