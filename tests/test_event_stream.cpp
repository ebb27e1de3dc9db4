#include <gtest/gtest.h>

#include "event_stream.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace gateway;

static std::vector<SseEvent> FeedInPieces(const std::string& body, size_t piece) {
  SseDecoder sse;
  std::vector<SseEvent> out;
  auto on_event = [&](const SseEvent& ev) {
    out.push_back(ev);
    return true;
  };
  for (size_t off = 0; off < body.size(); off += piece) {
    EXPECT_TRUE(sse.Feed(body.data() + off, std::min(piece, body.size() - off), on_event));
  }
  EXPECT_TRUE(sse.Finish(on_event));
  return out;
}

TEST(LineDecoderTest, SplitsAcrossReads) {
  LineDecoder d;
  std::vector<std::string> lines;
  auto on_line = [&](const std::string& l) {
    lines.push_back(l);
    return true;
  };
  ASSERT_TRUE(d.Feed("ab", 2, on_line));
  ASSERT_TRUE(d.Feed("c\r\nde", 5, on_line));
  ASSERT_TRUE(d.Feed("\n\nf", 3, on_line));
  ASSERT_TRUE(d.Finish(on_line));
  EXPECT_EQ(lines, (std::vector<std::string>{"abc", "de", "", "f"}));
}

TEST(LineDecoderTest, CallbackCanStop) {
  LineDecoder d;
  int calls = 0;
  EXPECT_FALSE(d.Feed("a\nb\nc\n", 6, [&](const std::string&) { return ++calls < 2; }));
  EXPECT_EQ(calls, 2);
}

TEST(SseDecoderTest, EventsIndependentOfPieceSize) {
  const std::string body =
      ": comment\n"
      "event: delta\n"
      "data: {\"a\":1}\n\n"
      "data: first\n"
      "data: second\n\n"
      "id: 7\n"
      "data:nospace\n\n";
  for (size_t piece : {1u, 3u, 64u}) {
    auto events = FeedInPieces(body, piece);
    ASSERT_EQ(events.size(), 3u) << piece;
    EXPECT_EQ(events[0].event, "delta");
    EXPECT_EQ(events[0].data, "{\"a\":1}");
    EXPECT_EQ(events[1].event, "");
    EXPECT_EQ(events[1].data, "first\nsecond");
    EXPECT_EQ(events[2].data, "nospace");
  }
}

TEST(SseDecoderTest, FinishFlushesUnterminatedEvent) {
  auto events = FeedInPieces("data: [DONE]", 4);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].data, "[DONE]");
}

TEST(SseDecoderTest, BlankLinesWithoutDataEmitNothing) {
  auto events = FeedInPieces("\n\nevent: ping\n\n", 2);
  EXPECT_TRUE(events.empty());
}
