#pragma once

#include "config.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace ollama_client {

struct OutgoingRequest {
  std::string method = "POST";
  std::string path;
  RequestHeaderList headers;
  std::string body;
};

// Receives the response as it is read. Returning false from on_status skips the body,
// returning false from on_data stops reading. on_end runs only when the body was read to EOF.
struct ResponseSink {
  std::function<bool(int status)> on_status;
  std::function<bool(const char* data, size_t len)> on_data;
  std::function<void()> on_end;
};

// One open connection. Destroying it releases the underlying socket.
class IConnection {
 public:
  virtual ~IConnection() = default;

  // Writes the whole body before reading. Returns the HTTP status.
  // Throws TransportError on connect/read/write failures; a read stopped by the sink is not a failure.
  virtual int Exchange(const OutgoingRequest& request, const ResponseSink& sink) = 0;
};

class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual std::unique_ptr<IConnection> Open(const EndpointDescriptor& descriptor) = 0;
};

}  // namespace ollama_client
