#include "json_codec.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace ollama_client {
namespace {

constexpr size_t kMaxLineInMessage = 200;

static std::string TruncateForMessage(std::string_view s) {
  if (s.size() <= kMaxLineInMessage) return std::string(s);
  return std::string(s.substr(0, kMaxLineInMessage)) + "...(truncated)";
}

}  // namespace

std::string JsonCodec::Encode(const nlohmann::json& value) const {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json JsonCodec::Decode(std::string_view text) const {
  auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded()) {
    throw DecodeError("invalid json line: " + TruncateForMessage(text));
  }
  return j;
}

std::string JsonCodec::EncodeBody(const IRequestBody& body) const {
  auto j = body.ToJson();
  if (!j.is_object()) {
    throw std::invalid_argument("request body must serialize to a json object");
  }
  return Encode(j);
}

}  // namespace ollama_client
