#pragma once

#include "response_decoder.hpp"

namespace ollama_client {

// /api/generate: {"response": "...", "done": false}
class GenerateResponseDecoder : public IResponseDecoder {
 public:
  Fragment Decode(const nlohmann::json& line) const override;
};

// /api/chat: {"message": {"role": "assistant", "content": "..."}, "done": false}
// The terminal line may carry no message at all.
class ChatResponseDecoder : public IResponseDecoder {
 public:
  Fragment Decode(const nlohmann::json& line) const override;
};

}  // namespace ollama_client
