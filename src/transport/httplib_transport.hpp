#pragma once

#include "transport/transport.hpp"

#include <memory>

namespace ollama_client {

class HttplibTransport : public ITransport {
 public:
  std::unique_ptr<IConnection> Open(const EndpointDescriptor& descriptor) override;
};

}  // namespace ollama_client
