#pragma once

#include "json_codec.hpp"
#include "response_decoder.hpp"
#include "status_classifier.hpp"
#include "transport/transport.hpp"

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

namespace ollama_client {

// Folds a newline-delimited JSON body into one accumulated text.
//
// The status decides, once per call, how every line is decoded. On the success path each line
// goes through the endpoint decoder and reading stops at the first final fragment. On error paths
// the extracted messages are concatenated in order.
//
// Failures raised while consuming a line (malformed JSON, a throwing sink) are captured and
// reading is stopped, so nothing is thrown through the transport. Call RethrowIfFailed() once the
// transport has returned.
class StreamingLineReducer {
 public:
  StreamingLineReducer(const JsonCodec& codec, const IResponseDecoder& decoder, FragmentSink sink = {});

  bool OnStatus(int status);
  bool OnData(const char* data, size_t len);
  void OnEnd();

  ResponseSink MakeSink();

  void RethrowIfFailed() const;

  int status() const { return status_; }
  StatusClass status_class() const { return class_; }
  bool finished() const { return finished_; }
  size_t lines_consumed() const { return lines_consumed_; }
  const std::string& accumulated() const { return accumulated_; }

 private:
  // Returns false when reading should stop.
  bool ConsumeLine(std::string_view line);
  bool ConsumeLineOrCapture(std::string_view line);

  const JsonCodec& codec_;
  const IResponseDecoder& decoder_;
  FragmentSink sink_;

  int status_ = 0;
  StatusClass class_ = StatusClass::kOtherError;
  bool finished_ = false;
  size_t lines_consumed_ = 0;
  std::string pending_;
  std::string accumulated_;
  std::exception_ptr error_;
};

}  // namespace ollama_client
