#pragma once

#include <string>
#include <utility>

namespace gateway {

enum class ErrorKind {
  kNone,
  // Request body that cannot be read: bad json, missing fields.
  kBadRequest,
  kUnknownModel,
  kInvalidTurns,
  kBackend,
  kTimeout,
  kMalformed,
  kCancelled,
};

struct GatewayError {
  ErrorKind kind = ErrorKind::kNone;
  // Upstream http status for kBackend, 0 when the request never got a response.
  int status = 0;
  std::string message;

  bool ok() const { return kind == ErrorKind::kNone; }
};

const char* ErrorKindName(ErrorKind kind);

// Maps an error kind to the status the http front end reports.
int HttpStatusForError(ErrorKind kind);

GatewayError MakeError(ErrorKind kind, std::string message, int status = 0);

inline void SetError(GatewayError* err, ErrorKind kind, std::string message, int status = 0) {
  if (err) *err = MakeError(kind, std::move(message), status);
}

}  // namespace gateway
