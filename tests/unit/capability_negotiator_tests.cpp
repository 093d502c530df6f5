#include "mcphub/methods.hpp"
#include "mcphub/session/capability_negotiator.hpp"
#include "mcphub/utils/error.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace mcphub;
using namespace mcphub::session;
using json = nlohmann::json;

class CapabilityNegotiatorTest : public ::testing::Test {
protected:
  static json initializeResult(const json &capabilities,
                               const std::string &version = kProtocolVersion) {
    return {{"protocolVersion", version},
            {"capabilities", capabilities},
            {"serverInfo", {{"name", "test-server"}, {"version", "0.1"}}}};
  }

  CapabilityNegotiator negotiator_{types::Implementation{"mcphub-test", "1.0"}};
};

TEST_F(CapabilityNegotiatorTest, AdvertisesTaskAugmentedClientRequests) {
  json params = negotiator_.buildInitializeParams();

  EXPECT_EQ(params["protocolVersion"], kProtocolVersion);
  EXPECT_EQ(params["clientInfo"]["name"], "mcphub-test");

  const auto &caps = params["capabilities"];
  EXPECT_TRUE(caps["roots"]["listChanged"].get<bool>());
  EXPECT_TRUE(caps.contains("sampling"));
  EXPECT_TRUE(caps["elicitation"].contains("form"));
  EXPECT_TRUE(caps["tasks"].contains("list"));
  EXPECT_TRUE(caps["tasks"].contains("cancel"));
  EXPECT_TRUE(caps["tasks"]["requests"]["sampling"].contains("createMessage"));
  EXPECT_TRUE(caps["tasks"]["requests"]["elicitation"].contains("create"));
}

TEST_F(CapabilityNegotiatorTest, OmitsDisabledFeatures) {
  CapabilityNegotiator negotiator(types::Implementation{"c", "1"}, {.roots = true,
                                               .sampling = false,
                                               .elicitation = false,
                                               .tasks = true});
  json caps = negotiator.localCapabilities();

  EXPECT_TRUE(caps.contains("roots"));
  EXPECT_FALSE(caps.contains("sampling"));
  EXPECT_FALSE(caps.contains("tasks"));
  EXPECT_FALSE(negotiator.acceptsTaskRequest(methods::CreateMessage));
}

TEST_F(CapabilityNegotiatorTest, RejectsUnsupportedProtocolVersion) {
  EXPECT_THROW(negotiator_.negotiate(initializeResult({}, "1999-01-01")),
               ProtocolException);
  EXPECT_FALSE(negotiator_.isNegotiated());
}

TEST_F(CapabilityNegotiatorTest, AcceptsOlderRevision) {
  auto result = negotiator_.negotiate(initializeResult({}, "2025-03-26"));
  EXPECT_EQ(result.protocolVersion, "2025-03-26");
  EXPECT_TRUE(negotiator_.isNegotiated());
}

TEST_F(CapabilityNegotiatorTest, RejectsMalformedInitializeResult) {
  EXPECT_THROW(negotiator_.negotiate(json{{"protocolVersion", kProtocolVersion}}),
               ProtocolException);
}

TEST_F(CapabilityNegotiatorTest, SupportsReflectsPeerCapabilities) {
  negotiator_.negotiate(initializeResult(
      {{"tools", json::object()},
       {"resources", {{"subscribe", false}}},
       {"logging", json::object()}}));

  EXPECT_TRUE(negotiator_.supports(Feature::Tools));
  EXPECT_TRUE(negotiator_.supports(Feature::Resources));
  EXPECT_FALSE(negotiator_.supports(Feature::ResourceSubscriptions));
  EXPECT_FALSE(negotiator_.supports(Feature::Prompts));
  EXPECT_TRUE(negotiator_.supports(Feature::Logging));
  EXPECT_FALSE(negotiator_.supports(Feature::Completions));

  EXPECT_NO_THROW(negotiator_.require(Feature::Tools, methods::ListTools));
  EXPECT_THROW(negotiator_.require(Feature::ResourceSubscriptions,
                                   methods::SubscribeResource),
               CapabilityException);
}

TEST_F(CapabilityNegotiatorTest, NoTaskAugmentationWithoutTasksCapability) {
  negotiator_.negotiate(initializeResult({{"tools", json::object()}}));

  EXPECT_FALSE(negotiator_.supportsTaskAugmentation(methods::CallTool, "echo"));
}

TEST_F(CapabilityNegotiatorTest, TaskAugmentationFollowsRequestsMap) {
  negotiator_.negotiate(initializeResult(
      {{"tools", json::object()},
       {"tasks",
        {{"list", json::object()},
         {"requests", {{"tools", {{"call", json::object()}}}}}}}}));

  EXPECT_TRUE(negotiator_.supportsTaskAugmentation(methods::CallTool, "echo"));
  EXPECT_FALSE(
      negotiator_.supportsTaskAugmentation(methods::GetPrompt, "echo"));
  EXPECT_TRUE(negotiator_.supports(Feature::TaskList));
  EXPECT_FALSE(negotiator_.supports(Feature::TaskCancel));
}

TEST_F(CapabilityNegotiatorTest, ForbiddenToolHintBlocksAugmentation) {
  negotiator_.negotiate(
      initializeResult({{"tools", json::object()},
                        {"tasks", {{"requests", {{"tools", {{"call", json::object()}}}}}}}}));

  types::Tool forbidden{"local", std::nullopt, json::object(),
                        types::TaskSupport::Forbidden};
  types::Tool required{"render", std::nullopt, json::object(),
                       types::TaskSupport::Required};
  negotiator_.recordTools({forbidden, required});

  EXPECT_FALSE(negotiator_.supportsTaskAugmentation(methods::CallTool, "local"));
  EXPECT_TRUE(negotiator_.supportsTaskAugmentation(methods::CallTool, "render"));
  EXPECT_TRUE(
      negotiator_.supportsTaskAugmentation(methods::CallTool, "unlisted"));

  negotiator_.forgetTools();
  EXPECT_FALSE(negotiator_.toolTaskSupport("local").has_value());
  EXPECT_TRUE(negotiator_.supportsTaskAugmentation(methods::CallTool, "local"));
}

TEST_F(CapabilityNegotiatorTest, ResetForgetsPeer) {
  negotiator_.negotiate(initializeResult({{"tools", json::object()}}));
  negotiator_.reset();

  EXPECT_FALSE(negotiator_.isNegotiated());
  EXPECT_FALSE(negotiator_.supports(Feature::Tools));
}
