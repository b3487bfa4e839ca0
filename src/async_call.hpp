#pragma once

#include "endpoint_caller.hpp"
#include "json_codec.hpp"
#include "response_decoder.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ollama_client {

enum class CallPhase {
  kCreated,
  kRunning,
  kSucceeded,
  kFailed,
};

// Single writer (the background call), any number of readers.
class FragmentQueue {
 public:
  void Push(Fragment f);
  std::optional<Fragment> TryPop();
  std::vector<Fragment> Drain();
  size_t Size() const;

 private:
  mutable std::mutex mu_;
  std::deque<Fragment> items_;
};

// Observes one background call. Copies share the same call.
//
// The terminal fields (response, status, time) are written once by the background thread before
// the phase becomes Succeeded or Failed; until then GetResponse() is empty and the status is 0.
// A failed call reports "[FAILED] <detail>" as its response.
class AsyncCallHandle {
 public:
  CallPhase Phase() const;
  bool IsComplete() const;
  bool IsSucceeded() const;
  std::string GetResponse() const;
  int GetHttpStatusCode() const;
  int64_t GetResponseTimeMillis() const;

  FragmentQueue& Fragments() const;

  // Returns true once the call has completed, false when the timeout expired first.
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  friend class AsyncCaller;
  struct State;

  explicit AsyncCallHandle(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

class AsyncCaller {
 public:
  // Serializes the body on the calling thread, then runs the exchange on a detached thread.
  // There is no cancellation: the call runs until it completes or fails.
  static AsyncCallHandle Start(const EndpointCaller& caller, const IRequestBody& body);
};

}  // namespace ollama_client
