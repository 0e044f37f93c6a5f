#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace trending::core {

enum class ErrorKind : uint8_t {
  Internal,
  Validation,
  Transport,
  HttpStatus,
  EmptyResult,
  Parse,
};

struct Error {
  std::string Message;
  ErrorKind Kind{ErrorKind::Internal};
  // URL of the request the error belongs to, empty when no request was made.
  std::string Url;
};

inline std::string_view toString(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::Internal:
    return "internal";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::HttpStatus:
    return "http_status";
  case ErrorKind::EmptyResult:
    return "empty_result";
  case ErrorKind::Parse:
    return "parse";
  }
  return "unknown";
}

} // namespace trending::core
