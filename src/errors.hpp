#pragma once

#include <stdexcept>
#include <string>

namespace ollama_client {

// Connect, resolve, read or write failure. Never retried.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg);
};

// The server answered with a status other than 200. what() is the message extracted from the body.
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(int status, const std::string& msg);

  int status() const { return status_; }

 private:
  int status_;
};

// A response line was not the JSON shape the endpoint promises.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg);
};

}  // namespace ollama_client
