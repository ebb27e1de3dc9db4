#include "chunk_stream.hpp"

namespace gateway {

const char* ChunkKindName(ChunkKind kind) {
  switch (kind) {
    case ChunkKind::kPartial:
      return "partial";
    case ChunkKind::kFinal:
      return "final";
    case ChunkKind::kError:
      return "error";
  }
  return "unknown";
}

}  // namespace gateway
