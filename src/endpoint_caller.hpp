#pragma once

#include "config.hpp"
#include "json_codec.hpp"
#include "response_decoder.hpp"
#include "transport/transport.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ollama_client {

struct CallResult {
  std::string response;
  int64_t response_time_ms = 0;
  int http_status_code = 0;
};

struct ExchangeOutcome {
  int status = 0;
  std::string accumulated;
};

class EndpointCaller {
 public:
  EndpointCaller(EndpointDescriptor descriptor,
                 std::shared_ptr<ITransport> transport,
                 std::shared_ptr<const JsonCodec> codec,
                 std::shared_ptr<const IResponseDecoder> decoder);

  // Blocks until the response is complete or the final fragment is seen.
  // Throws ProtocolError for status != 200, TransportError and DecodeError otherwise.
  CallResult CallSync(const IRequestBody& body) const;

  // Same as CallSync; on_fragment sees every success fragment on this thread before it is folded.
  CallResult CallStreaming(const IRequestBody& body, const FragmentSink& on_fragment) const;

  // One exchange over an already serialized body, whatever the status. The connection is released
  // before returning or throwing.
  ExchangeOutcome Exchange(const std::string& body, const FragmentSink& sink) const;

  const EndpointDescriptor& descriptor() const { return descriptor_; }
  const JsonCodec& codec() const { return *codec_; }

 private:
  CallResult Run(const IRequestBody& body, const FragmentSink& sink) const;

  EndpointDescriptor descriptor_;
  std::shared_ptr<ITransport> transport_;
  std::shared_ptr<const JsonCodec> codec_;
  std::shared_ptr<const IResponseDecoder> decoder_;
};

}  // namespace ollama_client
