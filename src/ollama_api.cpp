#include "ollama_api.hpp"

#include "api/decoders.hpp"
#include "errors.hpp"
#include "transport/httplib_transport.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace ollama_client {
namespace {

static std::string GetStringField(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

}  // namespace

OllamaApi::OllamaApi(ClientConfig cfg)
    : OllamaApi(std::move(cfg), std::make_shared<HttplibTransport>(), std::make_shared<JsonCodec>()) {}

OllamaApi::OllamaApi(ClientConfig cfg, std::shared_ptr<ITransport> transport, std::shared_ptr<const JsonCodec> codec)
    : cfg_(std::move(cfg)),
      transport_(std::move(transport)),
      codec_(std::move(codec)),
      generate_decoder_(std::make_shared<GenerateResponseDecoder>()),
      chat_decoder_(std::make_shared<ChatResponseDecoder>()) {
  while (!cfg_.endpoint.base_path.empty() && cfg_.endpoint.base_path.back() == '/') cfg_.endpoint.base_path.pop_back();
}

OllamaApi::RawResponse OllamaApi::OneShot(const std::string& method, const std::string& path, const std::string& body) {
  auto d = MakeDescriptor(cfg_, path, method);
  OutgoingRequest req;
  req.method = method;
  req.path = path;
  req.headers = BuildRequestHeaders(d);
  req.headers.emplace_back("Accept", "application/json");
  req.body = body;

  RawResponse out;
  ResponseSink sink;
  sink.on_status = [](int) { return true; };
  sink.on_data = [&out](const char* data, size_t len) {
    out.body.append(data, len);
    return true;
  };
  auto conn = transport_->Open(d);
  out.status = conn->Exchange(req, sink);
  return out;
}

OllamaApi::RawResponse OllamaApi::OneShotOk(const std::string& method, const std::string& path, const std::string& body) {
  auto res = OneShot(method, path, body);
  if (res.status != 200) {
    std::cout << "[ollama] " << method << " " << path << " status=" << res.status << "\n";
    throw ProtocolError(res.status, std::to_string(res.status) + " - " + res.body);
  }
  return res;
}

EndpointCaller OllamaApi::MakeCaller(const std::string& path, std::shared_ptr<const IResponseDecoder> decoder) const {
  return EndpointCaller(MakeDescriptor(cfg_, path), transport_, codec_, std::move(decoder));
}

bool OllamaApi::Ping() {
  try {
    return OneShot("GET", "/api/tags", "").status == 200;
  } catch (const TransportError& e) {
    std::cout << "[ollama] ping failed: " << e.what() << "\n";
    return false;
  }
}

std::vector<ModelInfo> OllamaApi::ListModels() {
  auto res = OneShotOk("GET", "/api/tags", "");
  auto j = codec_->Decode(res.body);
  std::vector<ModelInfo> out;
  if (!j.is_object() || !j.contains("models") || !j["models"].is_array()) return out;
  for (const auto& m : j["models"]) {
    if (!m.is_object()) continue;
    ModelInfo info;
    info.name = GetStringField(m, "name");
    info.modified_at = GetStringField(m, "modified_at");
    info.digest = GetStringField(m, "digest");
    if (m.contains("size") && m["size"].is_number_integer()) info.size = m["size"].get<int64_t>();
    if (!info.name.empty()) out.push_back(std::move(info));
  }
  return out;
}

ModelDetail OllamaApi::ShowModel(const std::string& name) {
  ModelRequest req;
  req.name = name;
  auto res = OneShotOk("POST", "/api/show", codec_->EncodeBody(req));
  auto j = codec_->Decode(res.body);
  if (!j.is_object()) throw DecodeError("invalid json from /api/show");
  ModelDetail d;
  d.license = GetStringField(j, "license");
  d.modelfile = GetStringField(j, "modelfile");
  d.parameters = GetStringField(j, "parameters");
  d.template_text = GetStringField(j, "template");
  return d;
}

void OllamaApi::PullModel(const std::string& name) {
  ModelRequest req;
  req.name = name;
  OneShotOk("POST", "/api/pull", codec_->EncodeBody(req));
}

void OllamaApi::DeleteModel(const std::string& name, bool ignore_if_not_present) {
  ModelRequest req;
  req.name = name;
  auto res = OneShot("DELETE", "/api/delete", codec_->EncodeBody(req));
  if (ignore_if_not_present && res.status == 404 && res.body.find("model") != std::string::npos &&
      res.body.find("not found") != std::string::npos) {
    return;
  }
  if (res.status != 200) {
    throw ProtocolError(res.status, std::to_string(res.status) + " - " + res.body);
  }
}

void OllamaApi::CreateModel(const std::string& name, const std::string& modelfile_path) {
  CreateModelRequest req;
  req.name = name;
  req.path = modelfile_path;
  RunCreate(req);
}

void OllamaApi::CreateModelFromContents(const std::string& name, const std::string& modelfile) {
  CreateModelRequest req;
  req.name = name;
  req.modelfile = modelfile;
  RunCreate(req);
}

void OllamaApi::RunCreate(const CreateModelRequest& req) {
  auto res = OneShotOk("POST", "/api/create", codec_->EncodeBody(req));
  if (res.body.find("error") != std::string::npos) {
    std::cout << "[ollama] create failed model=" << req.name << "\n";
    throw ProtocolError(res.status, res.body);
  }
  if (cfg_.verbose) std::cout << "[ollama] create model=" << req.name << " " << res.body << "\n";
}

std::vector<double> OllamaApi::Embeddings(const std::string& model, const std::string& prompt) {
  EmbeddingsRequest req;
  req.model = model;
  req.prompt = prompt;
  return Embeddings(req);
}

std::vector<double> OllamaApi::Embeddings(const EmbeddingsRequest& req) {
  auto res = OneShotOk("POST", "/api/embeddings", codec_->EncodeBody(req));
  auto j = codec_->Decode(res.body);
  if (!j.is_object() || !j.contains("embedding") || !j["embedding"].is_array()) {
    throw DecodeError("invalid json from /api/embeddings");
  }
  std::vector<double> vec;
  vec.reserve(j["embedding"].size());
  for (const auto& v : j["embedding"]) {
    if (!v.is_number()) throw DecodeError("non-numeric value in embedding");
    vec.push_back(v.get<double>());
  }
  return vec;
}

CallResult OllamaApi::Generate(GenerateRequest req, const FragmentSink& on_fragment) {
  auto caller = MakeCaller("/api/generate", generate_decoder_);
  if (on_fragment) {
    req.stream = true;
    return caller.CallStreaming(req, on_fragment);
  }
  req.stream = false;
  return caller.CallSync(req);
}

AsyncCallHandle OllamaApi::GenerateAsync(GenerateRequest req) {
  req.stream = true;
  return AsyncCaller::Start(MakeCaller("/api/generate", generate_decoder_), req);
}

ChatResult OllamaApi::Chat(ChatRequest req, const FragmentSink& on_fragment) {
  auto caller = MakeCaller("/api/chat", chat_decoder_);
  ChatResult out;
  if (on_fragment) {
    req.stream = true;
    out.result = caller.CallStreaming(req, on_fragment);
  } else {
    req.stream = false;
    out.result = caller.CallSync(req);
  }
  out.history = std::move(req.messages);
  out.history.push_back(ChatMessage{"assistant", out.result.response, {}});
  return out;
}

}  // namespace ollama_client
