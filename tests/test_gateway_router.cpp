#include <gtest/gtest.h>

#include "fakes.hpp"
#include "gateway_router.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace gateway;
using fakes::FakeAdapter;
using namespace std::chrono_literals;

TEST(GatewayRouterTest, PartialChunkJson) {
  ResultChunk c;
  c.origin = "a";
  c.index = 3;
  c.text = "hel";
  auto j = ChunkToJson(c);
  EXPECT_EQ(j["model"], "a");
  EXPECT_EQ(j["index"], 3);
  EXPECT_EQ(j["type"], ChunkKindName(ChunkKind::kPartial));
  EXPECT_EQ(j["text"], "hel");
  EXPECT_EQ(j["terminal"], false);
  EXPECT_FALSE(j.contains("error"));
}

TEST(GatewayRouterTest, ErrorChunkJson) {
  ResultChunk c;
  c.origin = "b";
  c.kind = ChunkKind::kError;
  c.terminal = true;
  c.error = MakeError(ErrorKind::kBackend, "b: http 503", 503);
  auto j = ChunkToJson(c);
  EXPECT_EQ(j["terminal"], true);
  EXPECT_FALSE(j.contains("text"));
  EXPECT_EQ(j["error"]["kind"], ErrorKindName(ErrorKind::kBackend));
  EXPECT_EQ(j["error"]["message"], "b: http 503");
  EXPECT_EQ(j["error"]["status"], 503);
}

TEST(GatewayRouterTest, ParseTurnsAcceptsStringAndPartContent) {
  auto j = nlohmann::json::parse(R"([
    {"role": "system", "content": "be brief"},
    {"role": "user", "content": [{"type": "text", "text": "hel"}, {"type": "text", "text": "lo"}]},
    {"role": "assistant", "content": null}
  ])");
  std::string err;
  auto turns = ParseTurns(j, &err);
  ASSERT_TRUE(turns) << err;
  ASSERT_EQ(turns->size(), 3u);
  EXPECT_EQ((*turns)[0].content, "be brief");
  EXPECT_EQ((*turns)[1].content, "hello");
  EXPECT_EQ((*turns)[2].content, "");
}

TEST(GatewayRouterTest, ParseTurnsRejectsMalformedMessages) {
  std::string err;
  EXPECT_FALSE(ParseTurns(nlohmann::json::object(), &err));
  EXPECT_FALSE(ParseTurns(nlohmann::json::parse(R"([{"content": "no role"}])"), &err));
  EXPECT_FALSE(ParseTurns(nlohmann::json::parse(R"([{"role": "user", "content": 5}])"), &err));

  // Unknown roles pass here and are rejected by the dispatcher.
  auto turns = ParseTurns(nlohmann::json::parse(R"([{"role": "tool", "content": "x"}])"), &err);
  ASSERT_TRUE(turns);
  EXPECT_EQ((*turns)[0].role, "tool");
}

// Router mounted on a loopback server in front of scripted adapters.
class GatewayRouterServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FakeAdapter::Script hang;
    hang.hang = true;
    FakeAdapter::Script empty;
    FakeAdapter::Script hello;
    hello.chunks = {"hel", "lo"};

    std::vector<std::unique_ptr<ModelAdapter>> adapters;
    adapters.push_back(std::make_unique<FakeAdapter>("slow", hang));
    adapters.push_back(std::make_unique<FakeAdapter>("empty", empty));
    adapters.push_back(std::make_unique<FakeAdapter>("hello", hello));
    std::string err;
    registry_ = ModelRegistry::Create(std::move(adapters), &err);
    ASSERT_TRUE(registry_) << err;
    dispatcher_ = std::make_unique<Dispatcher>(registry_.get(), 10s);
    router_ = std::make_unique<GatewayRouter>(dispatcher_.get());
    router_->Register(&server_);

    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) std::this_thread::sleep_for(1ms);
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  struct Reply {
    int status = 0;
    std::string body;
  };

  Reply PostJson(const std::string& path, const std::string& body) {
    httplib::Client cli("127.0.0.1", port_);
    cli.set_read_timeout(std::chrono::seconds(5));
    Reply out;
    auto res = cli.Post(path.c_str(), body, "application/json");
    if (res) {
      out.status = res->status;
      out.body = res->body;
    }
    return out;
  }

  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
  std::unique_ptr<ModelRegistry> registry_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<GatewayRouter> router_;
};

TEST_F(GatewayRouterServerTest, ClientDisconnectCancelsStream) {
  httplib::Client cli("127.0.0.1", port_);
  cli.set_read_timeout(std::chrono::seconds(5));
  httplib::Request req;
  req.method = "POST";
  req.path = "/generate/slow";
  req.body = R"({"prompt": "hi", "stream": true})";
  req.headers.emplace("Content-Type", "application/json");
  std::atomic<bool> got_bytes{false};
  req.content_receiver = [&](const char*, size_t, uint64_t, uint64_t) {
    got_bytes = true;
    return false;
  };
  cli.send(req);
  EXPECT_TRUE(got_bytes.load());

  // The hanging call only returns once the stream is cancelled, and the
  // request is counted when its stream is torn down.
  const auto until = Clock::now() + 3s;
  while (dispatcher_->Stats().total_requests == 0 && Clock::now() < until) std::this_thread::sleep_for(10ms);
  EXPECT_EQ(dispatcher_->Stats().total_requests, 1u);
}

TEST_F(GatewayRouterServerTest, UnreadableBodyIsBadRequest) {
  auto r = PostJson("/generate/hello", "{not json");
  EXPECT_EQ(r.status, 400);
  auto j = nlohmann::json::parse(r.body);
  EXPECT_EQ(j["error"]["kind"], "bad_request");

  r = PostJson("/generate_all", R"({"stream": false})");
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(nlohmann::json::parse(r.body)["error"]["kind"], "bad_request");

  r = PostJson("/conversation", R"({"messages": []})");
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(nlohmann::json::parse(r.body)["error"]["kind"], "bad_request");
}

TEST_F(GatewayRouterServerTest, MalformedMessagesAreInvalidTurns) {
  auto r = PostJson("/conversation", R"({"model_name": "hello", "messages": {"role": "user"}})");
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(nlohmann::json::parse(r.body)["error"]["kind"], "invalid_turns");

  r = PostJson("/conversation", R"({"model_name": "hello", "messages": []})");
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(nlohmann::json::parse(r.body)["error"]["kind"], "invalid_turns");
}

TEST_F(GatewayRouterServerTest, EmptyConversationStreamStillSendsSnapshot) {
  auto r = PostJson("/conversation_stream",
                    R"({"model_name": "empty", "messages": [{"role": "user", "content": "hi"}]})");
  EXPECT_EQ(r.status, 200);
  const std::string snapshot = "data: {\"reasoning\":\"\",\"response\":\"\"}\n\n";
  const auto at = r.body.find(snapshot);
  ASSERT_NE(at, std::string::npos) << r.body;
  EXPECT_NE(r.body.find("data: [DONE]", at), std::string::npos);
}

TEST_F(GatewayRouterServerTest, ConversationStreamSnapshotsAccumulate) {
  auto r = PostJson("/conversation_stream",
                    R"({"model_name": "hello", "messages": [{"role": "user", "content": "hi"}]})");
  EXPECT_EQ(r.status, 200);
  EXPECT_NE(r.body.find(R"({"reasoning":"","response":"hel"})"), std::string::npos) << r.body;
  EXPECT_NE(r.body.find(R"({"reasoning":"","response":"hello"})"), std::string::npos) << r.body;
  EXPECT_EQ(r.body.find(R"({"reasoning":"","response":""})"), std::string::npos) << r.body;
}
