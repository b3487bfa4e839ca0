#include "api/decoders.hpp"

#include "errors.hpp"

#include <string>

namespace ollama_client {
namespace {

static bool ReadDone(const nlohmann::json& line) {
  if (!line.contains("done") || line["done"].is_null()) return false;
  if (!line["done"].is_boolean()) throw DecodeError("field 'done' is not a boolean");
  return line["done"].get<bool>();
}

static std::string ReadOptionalString(const nlohmann::json& obj, const char* key) {
  if (!obj.contains(key) || obj[key].is_null()) return {};
  if (!obj[key].is_string()) throw DecodeError(std::string("field '") + key + "' is not a string");
  return obj[key].get<std::string>();
}

}  // namespace

Fragment GenerateResponseDecoder::Decode(const nlohmann::json& line) const {
  if (!line.is_object()) throw DecodeError("generate response line is not a json object");
  Fragment f;
  f.text = ReadOptionalString(line, "response");
  f.is_final = ReadDone(line);
  return f;
}

Fragment ChatResponseDecoder::Decode(const nlohmann::json& line) const {
  if (!line.is_object()) throw DecodeError("chat response line is not a json object");
  Fragment f;
  if (line.contains("message") && !line["message"].is_null()) {
    const auto& m = line["message"];
    if (!m.is_object()) throw DecodeError("field 'message' is not an object");
    f.text = ReadOptionalString(m, "content");
  }
  f.is_final = ReadDone(line);
  return f;
}

}  // namespace ollama_client
