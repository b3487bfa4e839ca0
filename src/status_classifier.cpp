#include "status_classifier.hpp"

#include "errors.hpp"

#include <string>

namespace ollama_client {

StatusClass ClassifyStatus(int status) {
  switch (status) {
    case 200:
      return StatusClass::kSuccess;
    case 404:
      return StatusClass::kNotFound;
    case 401:
      return StatusClass::kUnauthorized;
    case 400:
      return StatusClass::kBadRequest;
    default:
      return StatusClass::kOtherError;
  }
}

bool ReadsBody(StatusClass cls) {
  return cls != StatusClass::kUnauthorized;
}

std::string StatusLabel(int status) {
  switch (ClassifyStatus(status)) {
    case StatusClass::kSuccess:
      return "200 (OK)";
    case StatusClass::kNotFound:
      return "404 (Not Found)";
    case StatusClass::kUnauthorized:
      return "401 (Unauthorized)";
    case StatusClass::kBadRequest:
      return "400 (Bad Request)";
    case StatusClass::kOtherError:
      break;
  }
  return std::to_string(status);
}

std::string FixedErrorMessage(StatusClass cls) {
  if (cls == StatusClass::kUnauthorized) return "Unauthorized";
  return {};
}

std::string ExtractErrorMessage(StatusClass cls, std::string_view line, const JsonCodec& codec) {
  switch (cls) {
    case StatusClass::kUnauthorized:
      return FixedErrorMessage(cls);
    case StatusClass::kNotFound:
    case StatusClass::kBadRequest: {
      auto j = codec.Decode(line);
      if (!j.is_object()) throw DecodeError("error body line is not a json object");
      if (!j.contains("error")) return std::string(line);
      if (!j["error"].is_string()) throw DecodeError("error field is not a string");
      return j["error"].get<std::string>();
    }
    case StatusClass::kSuccess:
    case StatusClass::kOtherError:
      break;
  }
  return std::string(line);
}

}  // namespace ollama_client
