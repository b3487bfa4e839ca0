#pragma once

#include "json_codec.hpp"

#include <string>
#include <string_view>

namespace ollama_client {

enum class StatusClass {
  kSuccess,
  kNotFound,
  kUnauthorized,
  kBadRequest,
  kOtherError,
};

StatusClass ClassifyStatus(int status);

// 401 bodies are never read.
bool ReadsBody(StatusClass cls);

std::string StatusLabel(int status);

// Message used when the body is not read.
std::string FixedErrorMessage(StatusClass cls);

// Extracts the message carried by one line of an error body.
// Throws DecodeError when a 404/400 line is not an error envelope. An envelope without "error"
// yields the raw line.
std::string ExtractErrorMessage(StatusClass cls, std::string_view line, const JsonCodec& codec);

}  // namespace ollama_client
