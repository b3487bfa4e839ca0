#include "endpoint_caller.hpp"

#include "errors.hpp"
#include "line_reducer.hpp"
#include "status_classifier.hpp"

#include <cctype>
#include <chrono>
#include <iostream>
#include <utility>

namespace ollama_client {
namespace {

static std::string Trim(std::string s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

}  // namespace

EndpointCaller::EndpointCaller(EndpointDescriptor descriptor,
                               std::shared_ptr<ITransport> transport,
                               std::shared_ptr<const JsonCodec> codec,
                               std::shared_ptr<const IResponseDecoder> decoder)
    : descriptor_(std::move(descriptor)),
      transport_(std::move(transport)),
      codec_(std::move(codec)),
      decoder_(std::move(decoder)) {}

CallResult EndpointCaller::CallSync(const IRequestBody& body) const {
  return Run(body, nullptr);
}

CallResult EndpointCaller::CallStreaming(const IRequestBody& body, const FragmentSink& on_fragment) const {
  FragmentSink success_only;
  if (on_fragment) {
    success_only = [&on_fragment](const Fragment& f) {
      if (!f.is_error) on_fragment(f);
    };
  }
  return Run(body, success_only);
}

ExchangeOutcome EndpointCaller::Exchange(const std::string& body, const FragmentSink& sink) const {
  OutgoingRequest req;
  req.method = descriptor_.method;
  req.path = descriptor_.path;
  req.headers = BuildRequestHeaders(descriptor_);
  req.body = body;

  StreamingLineReducer reducer(*codec_, *decoder_, sink);
  ExchangeOutcome out;
  {
    auto conn = transport_->Open(descriptor_);
    out.status = conn->Exchange(req, reducer.MakeSink());
  }
  reducer.RethrowIfFailed();

  if (out.status != 200) {
    std::cout << "[ollama] status=" << StatusLabel(out.status) << " path=" << descriptor_.path << "\n";
  }
  out.accumulated = reducer.accumulated();
  return out;
}

CallResult EndpointCaller::Run(const IRequestBody& body, const FragmentSink& sink) const {
  const auto start = std::chrono::steady_clock::now();
  auto outcome = Exchange(codec_->EncodeBody(body), sink);
  if (outcome.status != 200) {
    throw ProtocolError(outcome.status, outcome.accumulated);
  }

  CallResult result;
  result.response = Trim(std::move(outcome.accumulated));
  result.response_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  result.http_status_code = outcome.status;
  if (descriptor_.verbose) {
    std::cout << "[ollama] model response status=" << result.http_status_code << " time_ms=" << result.response_time_ms
              << " response=" << result.response << "\n";
  }
  return result;
}

}  // namespace ollama_client
