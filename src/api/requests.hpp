#pragma once

#include "json_codec.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ollama_client {

struct ChatMessage {
  std::string role;
  std::string content;
  std::vector<std::string> images;
};

struct GenerateRequest : public IRequestBody {
  std::string model;
  std::string prompt;
  std::vector<std::string> images;
  std::optional<std::string> system;
  std::optional<std::string> template_text;
  std::optional<std::string> format;
  std::vector<int> context;
  std::optional<bool> raw;
  std::optional<std::string> keep_alive;
  nlohmann::json options = nlohmann::json::object();
  bool stream = false;

  nlohmann::json ToJson() const override;
};

struct ChatRequest : public IRequestBody {
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<std::string> format;
  std::optional<std::string> keep_alive;
  nlohmann::json options = nlohmann::json::object();
  bool stream = false;

  nlohmann::json ToJson() const override;
};

struct EmbeddingsRequest : public IRequestBody {
  std::string model;
  std::string prompt;
  std::optional<std::string> keep_alive;
  nlohmann::json options = nlohmann::json::object();

  nlohmann::json ToJson() const override;
};

// show / pull / delete
struct ModelRequest : public IRequestBody {
  std::string name;

  nlohmann::json ToJson() const override;
};

// create: from a modelfile already on the server (path) or from inline contents (modelfile).
struct CreateModelRequest : public IRequestBody {
  std::string name;
  std::optional<std::string> path;
  std::optional<std::string> modelfile;

  nlohmann::json ToJson() const override;
};

nlohmann::json ChatMessageToJson(const ChatMessage& m);

}  // namespace ollama_client
