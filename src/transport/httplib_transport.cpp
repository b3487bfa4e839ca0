#include "transport/httplib_transport.hpp"

#include "errors.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <utility>

namespace ollama_client {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const EndpointDescriptor& d) {
  auto cli = std::make_unique<httplib::Client>(d.endpoint.host, d.endpoint.port);
  cli->set_connection_timeout(d.timeout_seconds);
  cli->set_read_timeout(d.timeout_seconds);
  cli->set_write_timeout(d.timeout_seconds);
  return cli;
}

class HttplibConnection : public IConnection {
 public:
  explicit HttplibConnection(const EndpointDescriptor& descriptor)
      : base_path_(descriptor.endpoint.base_path), cli_(MakeClient(descriptor)) {}

  ~HttplibConnection() override { cli_->stop(); }

  int Exchange(const OutgoingRequest& request, const ResponseSink& sink) override {
    httplib::Request req;
    req.method = request.method;
    req.path = JoinPath(base_path_, request.path);
    for (const auto& kv : request.headers) req.set_header(kv.first, kv.second);
    req.body = request.body;

    int status = 0;
    bool stopped_by_sink = false;
    req.response_handler = [&](const httplib::Response& res) {
      status = res.status;
      if (sink.on_status && !sink.on_status(status)) {
        stopped_by_sink = true;
        return false;
      }
      return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t /*offset*/, uint64_t /*total*/) {
      if (sink.on_data && !sink.on_data(data, len)) {
        stopped_by_sink = true;
        return false;
      }
      return true;
    };

    auto res = cli_->send(req);
    if (!res) {
      if (stopped_by_sink && res.error() == httplib::Error::Canceled) return status;
      throw TransportError("http " + request.method + " " + req.path + " failed: " + httplib::to_string(res.error()));
    }
    if (sink.on_end) sink.on_end();
    return res->status;
  }

 private:
  std::string base_path_;
  std::unique_ptr<httplib::Client> cli_;
};

}  // namespace

std::unique_ptr<IConnection> HttplibTransport::Open(const EndpointDescriptor& descriptor) {
  return std::make_unique<HttplibConnection>(descriptor);
}

}  // namespace ollama_client
