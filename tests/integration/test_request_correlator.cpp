#include "mcp-hub/ipc/ProcessManager.hpp"
#include "mcp-hub/server/HandshakeEngine.hpp"
#include "mcp-hub/server/RequestCorrelator.hpp"
#include "TestFixtures.hpp"

#include <gtest/gtest.h>

using namespace mcphub;
using namespace mcphub::test;
using namespace std::chrono_literals;
using server::RequestCorrelator;

class RequestCorrelatorTest : public HubTest {
protected:
  std::shared_ptr<ipc::ChildProcess> start(const std::string &mode) {
    auto process = manager_.spawn(fake_server_config(mode), "test:" + mode);
    server::HandshakeEngine handshake(ids_, "mcp-hub-test", "0.0.1", 5s);
    EXPECT_TRUE(handshake.initialize(process));
    return process;
  }

  void TearDown() override {
    manager_.cleanup_all();
    HubTest::TearDown();
  }

  ipc::ProcessManager manager_{std::chrono::milliseconds(300)};
  ipc::RequestIdGenerator ids_;
  RequestCorrelator correlator_{ids_};
};

TEST_F(RequestCorrelatorTest, ToolCallCollectsResponse) {
  auto process = start("normal");
  auto result = correlator_.call_tool(process, "echo", {{"city", "Paris"}}, 500ms);

  EXPECT_TRUE(result.ok());
  ASSERT_TRUE(result.parsed_response.has_value());
  auto text = (*result.parsed_response)["result"]["content"][0]["text"];
  EXPECT_EQ(nlohmann::json::parse(text.get<std::string>())["city"], "Paris");
  EXPECT_FALSE(result.raw_output.empty());
  manager_.terminate_and_wait(process);
}

TEST_F(RequestCorrelatorTest, NullArgumentsBecomeEmptyObject) {
  auto process = start("normal");
  auto result = correlator_.call_tool(process, "echo", nullptr, 500ms);
  ASSERT_TRUE(result.parsed_response.has_value());
  EXPECT_EQ((*result.parsed_response)["result"]["content"][0]["text"], "{}");
  manager_.terminate_and_wait(process);
}

TEST_F(RequestCorrelatorTest, RawRequestGetsNewline) {
  auto process = start("normal");
  auto result = correlator_.call_raw(
      process, R"({"jsonrpc":"2.0","id":999,"method":"ping"})", 500ms);
  ASSERT_TRUE(result.parsed_response.has_value());
  EXPECT_EQ((*result.parsed_response)["id"], 999);
  manager_.terminate_and_wait(process);
}

TEST_F(RequestCorrelatorTest, ErrorResponseIsStillParsed) {
  auto process = start("normal");
  auto result = correlator_.call_tool(process, "nope", nullptr, 500ms);
  EXPECT_TRUE(result.ok());
  ASSERT_TRUE(result.parsed_response.has_value());
  EXPECT_EQ((*result.parsed_response)["error"]["code"], -32601);
  manager_.terminate_and_wait(process);
}

TEST_F(RequestCorrelatorTest, DetailsReturnBeforeWindowCloses) {
  auto process = start("normal");
  auto started = std::chrono::steady_clock::now();
  auto result = correlator_.fetch_details(process, 10s);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

  ASSERT_TRUE(result.parsed_response.has_value());
  auto tools = (*result.parsed_response)["result"]["tools"];
  ASSERT_TRUE(tools.is_array());
  EXPECT_EQ(tools.size(), 4u);
  EXPECT_EQ(tools[0]["name"], "echo");
  manager_.terminate_and_wait(process);
}

TEST_F(RequestCorrelatorTest, CrashReportsProcessDied) {
  auto process = start("normal");
  auto result = correlator_.call_tool(process, "crash", nullptr, 5s);

  EXPECT_EQ(result.outcome, CallResult::Outcome::ProcessDied);
  ASSERT_TRUE(result.exit_status && result.exit_status->code);
  EXPECT_EQ(*result.exit_status->code, 3);
  EXPECT_NE(result.error_message.find("process terminated during execution"),
            std::string::npos);
  EXPECT_FALSE(result.parsed_response.has_value());
}

TEST_F(RequestCorrelatorTest, WriteToDeadProcessIsCommunicationError) {
  auto process = start("exit-on-call");
  correlator_.call_tool(process, "echo", nullptr, 2s);
  ASSERT_TRUE(process->wait_for_exit(2s));

  auto result = correlator_.call_tool(process, "echo", nullptr, 500ms);
  EXPECT_EQ(result.outcome, CallResult::Outcome::CommunicationError);
  EXPECT_FALSE(result.error_message.empty());
}

TEST_F(RequestCorrelatorTest, SilentToolLeavesNoResponse) {
  auto process = start("normal");
  auto started = std::chrono::steady_clock::now();
  auto result = correlator_.call_tool(process, "slow", nullptr, 300ms);

  EXPECT_GE(std::chrono::steady_clock::now() - started, 300ms);
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.parsed_response.has_value());
  EXPECT_TRUE(result.raw_output.empty());
  manager_.terminate_and_wait(process);
}

TEST_F(RequestCorrelatorTest, ResultSerializesForCallers) {
  auto process = start("normal");
  auto result = correlator_.call_tool(process, "echo", nullptr, 300ms);
  auto j = result.to_json();
  EXPECT_TRUE(j.contains("rawOutput"));
  EXPECT_TRUE(j.contains("errorOutput"));
  EXPECT_TRUE(j["parsedResponse"].is_object());
  manager_.terminate_and_wait(process);
}
