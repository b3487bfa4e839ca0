#include "config.hpp"
#include "errors.hpp"
#include "ollama_api.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

static void PrintUsage() {
  std::cerr << "usage: ollama_client <command> [args]\n"
            << "  ping\n"
            << "  models\n"
            << "  generate <model> <prompt>\n"
            << "  stream <model> <prompt>\n"
            << "  async <model> <prompt>\n"
            << "  chat <model> <prompt>\n"
            << "  embed <model> <text>\n";
}

static ollama_client::GenerateRequest MakeGenerate(const std::string& model, const std::string& prompt) {
  ollama_client::GenerateRequest req;
  req.model = model;
  req.prompt = prompt;
  return req;
}

static int RunAsync(ollama_client::OllamaApi& api, const std::string& model, const std::string& prompt) {
  auto handle = api.GenerateAsync(MakeGenerate(model, prompt));
  const auto poll = std::chrono::milliseconds(100);
  while (!handle.IsComplete()) {
    for (const auto& f : handle.Fragments().Drain()) std::cout << f.text;
    std::this_thread::sleep_for(poll);
  }
  for (const auto& f : handle.Fragments().Drain()) std::cout << f.text;
  std::cout << "\n";
  std::cout << "[async] succeeded=" << (handle.IsSucceeded() ? 1 : 0) << " status=" << handle.GetHttpStatusCode()
            << " time_ms=" << handle.GetResponseTimeMillis() << "\n";
  if (!handle.IsSucceeded()) {
    std::cerr << handle.GetResponse() << "\n";
    return kExitFailure;
  }
  return kExitOk;
}

static int Run(ollama_client::OllamaApi& api, const std::string& command, const std::vector<std::string>& args) {
  if (command == "ping") {
    const bool ok = api.Ping();
    std::cout << "[ping] reachable=" << (ok ? 1 : 0) << "\n";
    return ok ? kExitOk : kExitFailure;
  }
  if (command == "models") {
    for (const auto& m : api.ListModels()) {
      std::cout << m.name << "\t" << m.size << "\t" << m.modified_at << "\n";
    }
    return kExitOk;
  }
  if (args.size() < 2) {
    PrintUsage();
    return kExitUsage;
  }
  const auto& model = args[0];
  const auto& text = args[1];

  if (command == "generate") {
    auto r = api.Generate(MakeGenerate(model, text));
    std::cout << r.response << "\n";
    return kExitOk;
  }
  if (command == "stream") {
    auto r = api.Generate(MakeGenerate(model, text), [](const ollama_client::Fragment& f) { std::cout << f.text; });
    std::cout << "\n[stream] time_ms=" << r.response_time_ms << "\n";
    return kExitOk;
  }
  if (command == "async") {
    return RunAsync(api, model, text);
  }
  if (command == "chat") {
    ollama_client::ChatRequest req;
    req.model = model;
    req.messages.push_back({"user", text, {}});
    auto r = api.Chat(std::move(req));
    std::cout << r.result.response << "\n";
    std::cout << "[chat] history_messages=" << r.history.size() << "\n";
    return kExitOk;
  }
  if (command == "embed") {
    auto vec = api.Embeddings(model, text);
    std::cout << "[embed] dimensions=" << vec.size() << "\n";
    return kExitOk;
  }
  PrintUsage();
  return kExitUsage;
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  if (argc < 2) {
    PrintUsage();
    return kExitUsage;
  }
  auto cfg = ollama_client::LoadConfigFromEnv();
  std::cout << "[client] endpoint=" << cfg.endpoint.scheme << "://" << cfg.endpoint.host << ":" << cfg.endpoint.port
            << cfg.endpoint.base_path << " timeout_s=" << cfg.request_timeout_seconds
            << " basic_auth=" << (cfg.basic_auth.has_value() ? "set" : "unset") << "\n";

  ollama_client::OllamaApi api(cfg);
  const std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);
  try {
    return Run(api, command, args);
  } catch (const ollama_client::ProtocolError& e) {
    std::cerr << "[error] status=" << e.status() << " " << e.what() << "\n";
  } catch (const ollama_client::TransportError& e) {
    std::cerr << "[error] transport " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[error] " << e.what() << "\n";
  }
  return kExitFailure;
}
