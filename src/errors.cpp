#include "errors.hpp"

#include <utility>

namespace gateway {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kBadRequest:
      return "bad_request";
    case ErrorKind::kUnknownModel:
      return "unknown_model";
    case ErrorKind::kInvalidTurns:
      return "invalid_turns";
    case ErrorKind::kBackend:
      return "backend_error";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kMalformed:
      return "malformed";
    case ErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

int HttpStatusForError(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return 200;
    case ErrorKind::kUnknownModel:
      return 404;
    case ErrorKind::kBadRequest:
    case ErrorKind::kInvalidTurns:
      return 400;
    case ErrorKind::kBackend:
    case ErrorKind::kMalformed:
      return 502;
    case ErrorKind::kTimeout:
      return 504;
    case ErrorKind::kCancelled:
      return 499;
  }
  return 500;
}

GatewayError MakeError(ErrorKind kind, std::string message, int status) {
  GatewayError e;
  e.kind = kind;
  e.status = status;
  e.message = std::move(message);
  return e;
}

}  // namespace gateway
