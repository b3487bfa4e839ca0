#pragma once

#include "api/requests.hpp"
#include "async_call.hpp"
#include "config.hpp"
#include "endpoint_caller.hpp"
#include "json_codec.hpp"
#include "response_decoder.hpp"
#include "transport/transport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ollama_client {

struct ModelInfo {
  std::string name;
  std::string modified_at;
  int64_t size = 0;
  std::string digest;
};

struct ModelDetail {
  std::string license;
  std::string modelfile;
  std::string parameters;
  std::string template_text;
};

struct ChatResult {
  CallResult result;
  // Request messages followed by the assistant reply.
  std::vector<ChatMessage> history;
};

class OllamaApi {
 public:
  explicit OllamaApi(ClientConfig cfg);
  OllamaApi(ClientConfig cfg, std::shared_ptr<ITransport> transport, std::shared_ptr<const JsonCodec> codec);

  const ClientConfig& config() const { return cfg_; }

  bool Ping();
  std::vector<ModelInfo> ListModels();
  ModelDetail ShowModel(const std::string& name);
  void PullModel(const std::string& name);
  void DeleteModel(const std::string& name, bool ignore_if_not_present);
  // modelfile_path names a file on the server. A 200 reply that mentions "error" still fails.
  void CreateModel(const std::string& name, const std::string& modelfile_path);
  void CreateModelFromContents(const std::string& name, const std::string& modelfile);

  std::vector<double> Embeddings(const std::string& model, const std::string& prompt);
  std::vector<double> Embeddings(const EmbeddingsRequest& req);

  // With a sink the request is streamed and the sink sees each fragment as it arrives.
  CallResult Generate(GenerateRequest req, const FragmentSink& on_fragment = {});
  AsyncCallHandle GenerateAsync(GenerateRequest req);
  ChatResult Chat(ChatRequest req, const FragmentSink& on_fragment = {});

 private:
  struct RawResponse {
    int status = 0;
    std::string body;
  };

  RawResponse OneShot(const std::string& method, const std::string& path, const std::string& body);
  RawResponse OneShotOk(const std::string& method, const std::string& path, const std::string& body);
  void RunCreate(const CreateModelRequest& req);
  EndpointCaller MakeCaller(const std::string& path, std::shared_ptr<const IResponseDecoder> decoder) const;

  ClientConfig cfg_;
  std::shared_ptr<ITransport> transport_;
  std::shared_ptr<const JsonCodec> codec_;
  std::shared_ptr<const IResponseDecoder> generate_decoder_;
  std::shared_ptr<const IResponseDecoder> chat_decoder_;
};

}  // namespace ollama_client
