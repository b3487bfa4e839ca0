#include "async_call.hpp"

#include <atomic>
#include <condition_variable>
#include <iostream>
#include <iterator>
#include <thread>
#include <utility>

namespace ollama_client {

void FragmentQueue::Push(Fragment f) {
  std::lock_guard<std::mutex> lock(mu_);
  items_.push_back(std::move(f));
}

std::optional<Fragment> FragmentQueue::TryPop() {
  std::lock_guard<std::mutex> lock(mu_);
  if (items_.empty()) return std::nullopt;
  Fragment f = std::move(items_.front());
  items_.pop_front();
  return f;
}

std::vector<Fragment> FragmentQueue::Drain() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Fragment> out(std::make_move_iterator(items_.begin()), std::make_move_iterator(items_.end()));
  items_.clear();
  return out;
}

size_t FragmentQueue::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return items_.size();
}

struct AsyncCallHandle::State {
  std::atomic<CallPhase> phase{CallPhase::kCreated};
  FragmentQueue fragments;

  std::string response;
  int http_status = 0;
  int64_t response_time_ms = 0;

  std::mutex mu;
  std::condition_variable cv;

  bool Terminal() const {
    auto p = phase.load(std::memory_order_acquire);
    return p == CallPhase::kSucceeded || p == CallPhase::kFailed;
  }

  void Finish(CallPhase terminal, std::string text, int status, int64_t time_ms) {
    response = std::move(text);
    http_status = status;
    response_time_ms = time_ms;
    {
      std::lock_guard<std::mutex> lock(mu);
      phase.store(terminal, std::memory_order_release);
    }
    cv.notify_all();
  }
};

AsyncCallHandle::AsyncCallHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

CallPhase AsyncCallHandle::Phase() const {
  return state_->phase.load(std::memory_order_acquire);
}

bool AsyncCallHandle::IsComplete() const {
  return state_->Terminal();
}

bool AsyncCallHandle::IsSucceeded() const {
  return Phase() == CallPhase::kSucceeded;
}

std::string AsyncCallHandle::GetResponse() const {
  if (!state_->Terminal()) return {};
  return state_->response;
}

int AsyncCallHandle::GetHttpStatusCode() const {
  if (!state_->Terminal()) return 0;
  return state_->http_status;
}

int64_t AsyncCallHandle::GetResponseTimeMillis() const {
  if (!state_->Terminal()) return 0;
  return state_->response_time_ms;
}

FragmentQueue& AsyncCallHandle::Fragments() const {
  return state_->fragments;
}

bool AsyncCallHandle::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mu);
  return state_->cv.wait_for(lock, timeout, [this]() { return state_->Terminal(); });
}

AsyncCallHandle AsyncCaller::Start(const EndpointCaller& caller, const IRequestBody& body) {
  auto state = std::make_shared<AsyncCallHandle::State>();
  std::string payload = caller.codec().EncodeBody(body);

  std::thread([caller, payload = std::move(payload), state]() {
    state->phase.store(CallPhase::kRunning, std::memory_order_release);
    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() -> int64_t {
      return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    };

    CallPhase terminal = CallPhase::kFailed;
    std::string text;
    int status = 0;
    try {
      auto outcome = caller.Exchange(payload, [&state](const Fragment& f) { state->fragments.Push(f); });
      status = outcome.status;
      if (outcome.status == 200) {
        terminal = CallPhase::kSucceeded;
        text = std::move(outcome.accumulated);
      } else {
        text = "[FAILED] " + outcome.accumulated;
      }
    } catch (const std::exception& e) {
      text = std::string("[FAILED] ") + e.what();
    }

    const auto time_ms = elapsed_ms();
    if (caller.descriptor().verbose) {
      std::cout << "[ollama] async call done path=" << caller.descriptor().path
                << " succeeded=" << (terminal == CallPhase::kSucceeded ? 1 : 0) << " status=" << status
                << " time_ms=" << time_ms << "\n";
    }
    state->Finish(terminal, std::move(text), status, time_ms);
  }).detach();

  return AsyncCallHandle(std::move(state));
}

}  // namespace ollama_client
