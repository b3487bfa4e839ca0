#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace ollama_client {

// A request payload. Must serialize to a single JSON object.
class IRequestBody {
 public:
  virtual ~IRequestBody() = default;

  virtual nlohmann::json ToJson() const = 0;
};

class JsonCodec {
 public:
  std::string Encode(const nlohmann::json& value) const;

  // Throws DecodeError when `text` is not valid JSON.
  nlohmann::json Decode(std::string_view text) const;

  // Throws std::invalid_argument when the body does not produce a JSON object.
  std::string EncodeBody(const IRequestBody& body) const;
};

}  // namespace ollama_client
