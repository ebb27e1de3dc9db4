#include <gtest/gtest.h>

#include "reasoning.hpp"

#include <string>
#include <vector>

using namespace gateway;

TEST(WithReasoningPromptTest, PrependsSystemTurn) {
  auto turns = WithReasoningPrompt({{"user", "hi"}});
  ASSERT_EQ(turns.size(), 2u);
  EXPECT_EQ(turns[0].role, "system");
  EXPECT_EQ(turns[0].content, kReasoningSystemPrompt);
  EXPECT_EQ(turns[1].content, "hi");
}

TEST(WithReasoningPromptTest, ReplacesExistingSystemTurn) {
  auto turns = WithReasoningPrompt({{"system", "be nice"}, {"user", "hi"}});
  ASSERT_EQ(turns.size(), 2u);
  EXPECT_EQ(turns[0].content, kReasoningSystemPrompt);
}

TEST(SplitReasoningTest, SplitsAndTrims) {
  auto s = SplitReasoning("思考： because \n\n回答：  42 \n");
  EXPECT_EQ(s.reasoning, "because");
  EXPECT_EQ(s.response, "42");
}

TEST(SplitReasoningTest, WithoutMarkersWholeTextIsResponse) {
  auto s = SplitReasoning("just an answer");
  EXPECT_EQ(s.reasoning, "");
  EXPECT_EQ(s.response, "just an answer");

  s = SplitReasoning("思考：thinking but no answer");
  EXPECT_EQ(s.reasoning, "");
  EXPECT_EQ(s.response, "思考：thinking but no answer");
}

TEST(ReasoningStreamSplitterTest, SnapshotsFollowPhases) {
  ReasoningStreamSplitter splitter(true);
  std::vector<ReasoningSplit> snaps;
  for (const char* d : {"思考：", "two", " plus two", "\n回答：", "4"}) {
    if (auto s = splitter.Feed(d)) snaps.push_back(*s);
  }
  ASSERT_FALSE(snaps.empty());
  EXPECT_EQ(snaps.back().reasoning, "two plus two\n");
  EXPECT_EQ(snaps.back().response, "4");

  bool saw_reasoning_only = false;
  for (const auto& s : snaps) {
    if (s.reasoning == "two plus two" && s.response.empty()) saw_reasoning_only = true;
  }
  EXPECT_TRUE(saw_reasoning_only);

  auto fin = splitter.Finish();
  EXPECT_EQ(fin.reasoning, "two plus two\n");
  EXPECT_EQ(fin.response, "4");
}

TEST(ReasoningStreamSplitterTest, MarkerSplitAcrossDeltas) {
  const std::string answer = kAnswerMarker;
  ReasoningStreamSplitter splitter(true);
  ASSERT_TRUE(splitter.Feed(std::string(kReasoningMarker) + "r"));
  // Half of the answer marker is not yet an answer.
  auto s = splitter.Feed(answer.substr(0, 3));
  if (s) EXPECT_TRUE(s->response.empty());
  s = splitter.Feed(answer.substr(3) + "ok");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->reasoning, "r");
  EXPECT_EQ(s->response, "ok");
}

TEST(ReasoningStreamSplitterTest, HiddenReasoningStaysEmpty) {
  ReasoningStreamSplitter splitter(false);
  EXPECT_FALSE(splitter.Feed("思考：secret"));
  auto s = splitter.Feed("回答：visible");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->reasoning, "");
  EXPECT_EQ(s->response, "visible");
  EXPECT_EQ(splitter.Finish().reasoning, "");
}

TEST(ReasoningStreamSplitterTest, NoMarkersFinishesWithFullText) {
  ReasoningStreamSplitter splitter(true);
  EXPECT_FALSE(splitter.Feed("plain "));
  EXPECT_FALSE(splitter.Feed("text"));
  auto fin = splitter.Finish();
  EXPECT_EQ(fin.reasoning, "");
  EXPECT_EQ(fin.response, "plain text");
}

TEST(ReasoningStreamSplitterTest, MissingAnswerReportsReasoningAsResponse) {
  ReasoningStreamSplitter splitter(true);
  splitter.Feed("思考：only thoughts");
  auto fin = splitter.Finish();
  EXPECT_EQ(fin.reasoning, "only thoughts");
  EXPECT_EQ(fin.response, "only thoughts");
}
