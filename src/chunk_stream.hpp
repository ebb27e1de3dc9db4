#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace gateway {

enum class ChunkKind {
  kPartial,
  kFinal,
  kError,
};

const char* ChunkKindName(ChunkKind kind);

struct ResultChunk {
  std::string origin;
  // Strictly increasing per origin, starting at 0.
  std::size_t index = 0;
  ChunkKind kind = ChunkKind::kPartial;
  // Delta for kPartial, the full accumulated text for kFinal.
  std::string text;
  GatewayError error;
  bool terminal = false;
};

// Lazy, finite, non-restartable sequence of chunks. Not safe for concurrent
// consumers; Cancel() may be called from any thread.
class ChunkStream {
 public:
  virtual ~ChunkStream() = default;

  // Blocks until the next chunk is available. std::nullopt once every origin
  // has delivered its terminal chunk.
  virtual std::optional<ResultChunk> Next() = 0;

  // Waits at most `timeout`. Returns std::nullopt on timeout or exhaustion;
  // *finished tells the two apart.
  virtual std::optional<ResultChunk> NextFor(std::chrono::milliseconds timeout, bool* finished) = 0;

  virtual void Cancel() = 0;
};

}  // namespace gateway
