#include "errors.hpp"

namespace ollama_client {

TransportError::TransportError(const std::string& msg) : std::runtime_error(msg) {}

ProtocolError::ProtocolError(int status, const std::string& msg) : std::runtime_error(msg), status_(status) {}

DecodeError::DecodeError(const std::string& msg) : std::runtime_error(msg) {}

}  // namespace ollama_client
