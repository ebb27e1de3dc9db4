#include "reasoning.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace gateway {

const char* const kReasoningMarker = "思考：";
const char* const kAnswerMarker = "回答：";
const char* const kReasoningSystemPrompt =
    "请先进行思考，分析问题并给出推理过程，然后再给出最终答案。格式为：\n\n思考：[你的分析和推理过程]\n\n回答：[你的最终答案]";

namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

// Text following the first occurrence of marker, or nullopt.
static std::optional<std::string> After(const std::string& s, const char* marker) {
  auto pos = s.find(marker);
  if (pos == std::string::npos) return std::nullopt;
  return s.substr(pos + std::strlen(marker));
}

}  // namespace

std::vector<ChatTurn> WithReasoningPrompt(std::vector<ChatTurn> turns) {
  bool has_system = false;
  for (auto& t : turns) {
    if (t.role != "system") continue;
    t.content = kReasoningSystemPrompt;
    has_system = true;
  }
  if (!has_system) turns.insert(turns.begin(), ChatTurn{"system", kReasoningSystemPrompt});
  return turns;
}

ReasoningSplit SplitReasoning(const std::string& text) {
  ReasoningSplit out;
  out.response = text;
  const auto answer_pos = text.find(kAnswerMarker);
  if (text.find(kReasoningMarker) == std::string::npos || answer_pos == std::string::npos) return out;

  out.response = Trim(text.substr(answer_pos + std::strlen(kAnswerMarker)));
  if (auto r = After(text.substr(0, answer_pos), kReasoningMarker)) out.reasoning = Trim(*r);
  return out;
}

std::optional<ReasoningSplit> ReasoningStreamSplitter::Feed(const std::string& delta) {
  if (delta.empty()) return std::nullopt;
  full_ += delta;
  return Advance();
}

std::optional<ReasoningSplit> ReasoningStreamSplitter::Advance() {
  std::optional<ReasoningSplit> out;

  if (phase_ == Phase::kInit) {
    auto r = After(full_, kReasoningMarker);
    if (!r) return std::nullopt;
    phase_ = Phase::kReasoning;
    reasoning_ = std::move(*r);
    if (show_reasoning_) out = ReasoningSplit{reasoning_, ""};
  }

  if (phase_ == Phase::kReasoning) {
    const auto answer_pos = full_.find(kAnswerMarker);
    if (answer_pos == std::string::npos) {
      auto r = After(full_, kReasoningMarker);
      if (r && *r != reasoning_) {
        reasoning_ = std::move(*r);
        if (show_reasoning_) out = ReasoningSplit{reasoning_, ""};
      }
      return out;
    }
    phase_ = Phase::kResponse;
    reasoning_ = After(full_.substr(0, answer_pos), kReasoningMarker).value_or(std::string());
    response_ = full_.substr(answer_pos + std::strlen(kAnswerMarker));
    return ReasoningSplit{Visible(reasoning_), response_};
  }

  auto r = After(full_, kAnswerMarker);
  if (r && *r != response_) {
    response_ = std::move(*r);
    return ReasoningSplit{Visible(reasoning_), response_};
  }
  return std::nullopt;
}

ReasoningSplit ReasoningStreamSplitter::Finish() const {
  switch (phase_) {
    case Phase::kInit:
      return ReasoningSplit{"", full_};
    case Phase::kReasoning:
      // The model never produced an answer section.
      return ReasoningSplit{Visible(reasoning_), reasoning_};
    case Phase::kResponse:
      break;
  }
  const auto answer_pos = full_.find(kAnswerMarker);
  std::string reasoning = After(full_.substr(0, answer_pos), kReasoningMarker).value_or(std::string());
  return ReasoningSplit{Visible(reasoning), full_.substr(answer_pos + std::strlen(kAnswerMarker))};
}

}  // namespace gateway
