#include "line_reducer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace ollama_client {
namespace {

static bool IsBlank(std::string_view s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

StreamingLineReducer::StreamingLineReducer(const JsonCodec& codec, const IResponseDecoder& decoder, FragmentSink sink)
    : codec_(codec), decoder_(decoder), sink_(std::move(sink)) {}

bool StreamingLineReducer::OnStatus(int status) {
  status_ = status;
  class_ = ClassifyStatus(status);
  if (!ReadsBody(class_)) {
    accumulated_ = FixedErrorMessage(class_);
    return false;
  }
  return true;
}

bool StreamingLineReducer::OnData(const char* data, size_t len) {
  if (finished_ || error_) return false;
  pending_.append(data, len);

  size_t start = 0;
  for (;;) {
    const auto nl = pending_.find('\n', start);
    if (nl == std::string::npos) break;
    std::string_view line(pending_.data() + start, nl - start);
    start = nl + 1;
    if (!ConsumeLineOrCapture(line)) {
      pending_.clear();
      return false;
    }
  }
  pending_.erase(0, start);
  return true;
}

void StreamingLineReducer::OnEnd() {
  if (finished_ || error_ || pending_.empty()) return;
  std::string last = std::move(pending_);
  pending_.clear();
  ConsumeLineOrCapture(last);
}

ResponseSink StreamingLineReducer::MakeSink() {
  ResponseSink sink;
  sink.on_status = [this](int status) { return OnStatus(status); };
  sink.on_data = [this](const char* data, size_t len) { return OnData(data, len); };
  sink.on_end = [this]() { OnEnd(); };
  return sink;
}

void StreamingLineReducer::RethrowIfFailed() const {
  if (error_) std::rethrow_exception(error_);
}

bool StreamingLineReducer::ConsumeLineOrCapture(std::string_view line) {
  try {
    return ConsumeLine(line);
  } catch (const std::exception&) {
    error_ = std::current_exception();
    return false;
  }
}

bool StreamingLineReducer::ConsumeLine(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  if (IsBlank(line)) return true;
  lines_consumed_++;

  if (class_ != StatusClass::kSuccess) {
    Fragment f;
    f.text = ExtractErrorMessage(class_, line, codec_);
    f.is_error = true;
    if (sink_) sink_(f);
    accumulated_ += f.text;
    return true;
  }

  Fragment f = decoder_.Decode(codec_.Decode(line));
  if (sink_) sink_(f);
  if (!(f.is_final && f.text.empty())) accumulated_ += f.text;
  if (f.is_final) {
    finished_ = true;
    return false;
  }
  return true;
}

}  // namespace ollama_client
