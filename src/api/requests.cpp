#include "api/requests.hpp"

namespace ollama_client {
namespace {

static void PutOptions(nlohmann::json& j, const nlohmann::json& options) {
  if (options.is_object() && !options.empty()) j["options"] = options;
}

}  // namespace

nlohmann::json ChatMessageToJson(const ChatMessage& m) {
  nlohmann::json jm;
  jm["role"] = m.role;
  jm["content"] = m.content;
  if (!m.images.empty()) jm["images"] = m.images;
  return jm;
}

nlohmann::json GenerateRequest::ToJson() const {
  nlohmann::json j;
  j["model"] = model;
  j["prompt"] = prompt;
  j["stream"] = stream;
  if (!images.empty()) j["images"] = images;
  if (system.has_value()) j["system"] = *system;
  if (template_text.has_value()) j["template"] = *template_text;
  if (format.has_value()) j["format"] = *format;
  if (!context.empty()) j["context"] = context;
  if (raw.has_value()) j["raw"] = *raw;
  if (keep_alive.has_value()) j["keep_alive"] = *keep_alive;
  PutOptions(j, options);
  return j;
}

nlohmann::json ChatRequest::ToJson() const {
  nlohmann::json j;
  j["model"] = model;
  j["stream"] = stream;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : messages) j["messages"].push_back(ChatMessageToJson(m));
  if (format.has_value()) j["format"] = *format;
  if (keep_alive.has_value()) j["keep_alive"] = *keep_alive;
  PutOptions(j, options);
  return j;
}

nlohmann::json EmbeddingsRequest::ToJson() const {
  nlohmann::json j;
  j["model"] = model;
  j["prompt"] = prompt;
  if (keep_alive.has_value()) j["keep_alive"] = *keep_alive;
  PutOptions(j, options);
  return j;
}

nlohmann::json ModelRequest::ToJson() const {
  nlohmann::json j;
  j["name"] = name;
  return j;
}

nlohmann::json CreateModelRequest::ToJson() const {
  nlohmann::json j;
  j["name"] = name;
  if (path.has_value()) j["path"] = *path;
  if (modelfile.has_value()) j["modelfile"] = *modelfile;
  return j;
}

}  // namespace ollama_client
