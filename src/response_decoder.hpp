#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace ollama_client {

struct Fragment {
  std::string text;
  bool is_final = false;
  bool is_error = false;
};

using FragmentSink = std::function<void(const Fragment&)>;

// Knows the success-path schema of one endpoint.
class IResponseDecoder {
 public:
  virtual ~IResponseDecoder() = default;

  // Throws DecodeError when the line does not match the schema.
  virtual Fragment Decode(const nlohmann::json& line) const = 0;
};

}  // namespace ollama_client
