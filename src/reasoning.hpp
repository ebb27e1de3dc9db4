#pragma once

#include "adapters/adapter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gateway {

extern const char* const kReasoningMarker;
extern const char* const kAnswerMarker;
extern const char* const kReasoningSystemPrompt;

// Replaces the content of existing system turns with the reasoning prompt, or
// prepends one system turn when there is none.
std::vector<ChatTurn> WithReasoningPrompt(std::vector<ChatTurn> turns);

struct ReasoningSplit {
  std::string reasoning;
  std::string response;
};

// Text after the answer marker is the response, text between the markers the
// reasoning (both trimmed). Without both markers the whole text is the response.
ReasoningSplit SplitReasoning(const std::string& text);

// Incremental variant used for streamed conversations. Each Feed() returns the
// current {reasoning, response} snapshot when the visible output changed.
class ReasoningStreamSplitter {
 public:
  explicit ReasoningStreamSplitter(bool show_reasoning) : show_reasoning_(show_reasoning) {}

  std::optional<ReasoningSplit> Feed(const std::string& delta);

  // Snapshot to emit once the stream is complete.
  ReasoningSplit Finish() const;

 private:
  enum class Phase { kInit, kReasoning, kResponse };

  std::optional<ReasoningSplit> Advance();
  std::string Visible(const std::string& reasoning) const { return show_reasoning_ ? reasoning : std::string(); }

  bool show_reasoning_;
  Phase phase_ = Phase::kInit;
  std::string full_;
  std::string reasoning_;
  std::string response_;
};

}  // namespace gateway
