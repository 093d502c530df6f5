#include "common/mock_transport.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/session/request_correlator.hpp"
#include "mcphub/utils/error.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace mcphub;
using namespace mcphub::session;
using json = nlohmann::json;
using namespace std::chrono_literals;

class RequestCorrelatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_ = std::make_shared<
        ::testing::NiceMock<testing_support::MockTransport>>();
    transport_->recordSends();
    correlator_ = std::make_unique<RequestCorrelator>(transport_, scheduler_,
                                                      "test");
  }

  void TearDown() override {
    correlator_.reset();
    scheduler_.shutdown();
  }

  types::JSONRPCResponse response(const types::RequestId &id,
                                  const json &result) {
    types::JSONRPCResponse message;
    message.id = id;
    message.result = result;
    return message;
  }

  utils::Scheduler scheduler_;
  std::shared_ptr<::testing::NiceMock<testing_support::MockTransport>>
      transport_;
  std::unique_ptr<RequestCorrelator> correlator_;
};

TEST_F(RequestCorrelatorTest, ResolvesMatchingResponse) {
  auto call = correlator_->send(methods::CallTool, json{{"name", "echo"}}, {});

  auto sent = transport_->lastRequest();
  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ(sent->method, methods::CallTool);
  EXPECT_EQ(types::requestIdToString(sent->id),
            types::requestIdToString(call.id));
  EXPECT_EQ(correlator_->pendingCount(), 1u);

  EXPECT_TRUE(correlator_->handleResponse(response(call.id, {{"ok", true}})));
  EXPECT_EQ(call.result.get()["ok"], true);
  EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, InjectsProgressToken) {
  RequestOptions options;
  options.progress_token = "pt-1";
  correlator_->send(methods::CallTool, std::nullopt, std::move(options));

  auto sent = transport_->lastRequest();
  ASSERT_TRUE(sent.has_value());
  ASSERT_TRUE(sent->params.has_value());
  EXPECT_EQ((*sent->params)["_meta"]["progressToken"], "pt-1");
}

TEST_F(RequestCorrelatorTest, OutOfOrderResponsesReachTheirCallers) {
  auto first = correlator_->send(methods::CallTool, json{{"n", 1}}, {});
  auto second = correlator_->send(methods::CallTool, json{{"n", 2}}, {});

  correlator_->handleResponse(response(second.id, {{"n", 2}}));
  correlator_->handleResponse(response(first.id, {{"n", 1}}));

  EXPECT_EQ(first.result.get()["n"], 1);
  EXPECT_EQ(second.result.get()["n"], 2);
}

TEST_F(RequestCorrelatorTest, UnknownResponseIsIgnored) {
  EXPECT_FALSE(correlator_->handleResponse(response(std::string("nope"), {})));
}

TEST_F(RequestCorrelatorTest, CancelUnknownIdIsNoop) {
  EXPECT_NO_THROW(
      EXPECT_FALSE(correlator_->cancel(std::string("unknown"), "gone")));
  EXPECT_EQ(transport_->countSent(methods::Cancelled), 0u);
}

TEST_F(RequestCorrelatorTest, CancelSettlesOnceAndNotifiesPeer) {
  std::atomic<int> settled{0};
  RequestOptions options;
  options.on_settled = [&settled]() { ++settled; };
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  EXPECT_TRUE(correlator_->cancel(call.id, "user abort"));
  EXPECT_THROW(call.result.get(), CancelledException);

  auto notification = transport_->lastNotification();
  ASSERT_TRUE(notification.has_value());
  EXPECT_EQ(notification->method, methods::Cancelled);
  EXPECT_EQ((*notification->params)["reason"], "user abort");

  // Late events for the same id are ignored.
  EXPECT_FALSE(correlator_->handleResponse(response(call.id, {})));
  EXPECT_FALSE(correlator_->cancel(call.id, "again"));
  EXPECT_EQ(settled, 1);
}

TEST_F(RequestCorrelatorTest, HandshakeIsNotCancellable) {
  RequestOptions options;
  options.cancellable = false;
  auto call = correlator_->send(methods::Initialize, json::object(),
                                std::move(options));

  EXPECT_THROW(correlator_->cancel(call.id, std::nullopt),
               NotCancellableException);
  EXPECT_TRUE(correlator_->isPending(call.id));
  EXPECT_EQ(transport_->countSent(methods::Cancelled), 0u);

  correlator_->handleResponse(response(call.id, {{"done", true}}));
  EXPECT_EQ(call.result.get()["done"], true);
}

TEST_F(RequestCorrelatorTest, DeadlineFailsWithTimeout) {
  RequestOptions options;
  options.timeout = 20ms;
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  ASSERT_EQ(call.result.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(call.result.get(), TimeoutException);
  EXPECT_FALSE(correlator_->isPending(call.id));
  EXPECT_EQ(transport_->countSent(methods::Cancelled), 1u);
}

TEST_F(RequestCorrelatorTest, DeadlineRunsSettledHook) {
  std::atomic<int> settled{0};
  std::atomic<int> results{0};
  RequestOptions options;
  options.timeout = 20ms;
  options.on_result = [&results](const json &) { ++results; };
  options.on_settled = [&settled]() { ++settled; };
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  ASSERT_EQ(call.result.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(call.result.get(), TimeoutException);
  EXPECT_EQ(settled, 1);
  EXPECT_EQ(results, 0);
}

TEST_F(RequestCorrelatorTest, ResultHookRunsBeforeFutureIsReady) {
  std::atomic<bool> hooked{false};
  RequestOptions options;
  options.on_result = [&hooked](const json &result) {
    EXPECT_EQ(result["n"], 7);
    hooked = true;
  };
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  EXPECT_FALSE(hooked);
  correlator_->handleResponse(response(call.id, {{"n", 7}}));
  EXPECT_TRUE(hooked);
  EXPECT_EQ(call.result.get()["n"], 7);
}

TEST_F(RequestCorrelatorTest, ThrowingResultHookFailsTheRequest) {
  std::atomic<int> settled{0};
  RequestOptions options;
  options.on_result = [](const json &) {
    throw ProtocolException(types::ErrorCode::InvalidParams, "bad shape");
  };
  options.on_settled = [&settled]() { ++settled; };
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  EXPECT_TRUE(correlator_->handleResponse(response(call.id, json::object())));
  EXPECT_THROW(call.result.get(), ProtocolException);
  EXPECT_EQ(settled, 1);
}

TEST_F(RequestCorrelatorTest, ResponseBeforeDeadlineCancelsTimer) {
  RequestOptions options;
  options.timeout = 50ms;
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));
  correlator_->handleResponse(response(call.id, json::object()));

  EXPECT_NO_THROW(call.result.get());
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(transport_->countSent(methods::Cancelled), 0u);
  EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(RequestCorrelatorTest, StopTokenCancelsRequest) {
  std::stop_source stop;
  RequestOptions options;
  options.stop_token = stop.get_token();
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  stop.request_stop();
  EXPECT_THROW(call.result.get(), CancelledException);
  EXPECT_EQ(transport_->countSent(methods::Cancelled), 1u);
}

TEST_F(RequestCorrelatorTest, StoppedTokenNeverSends) {
  std::stop_source stop;
  stop.request_stop();
  RequestOptions options;
  options.stop_token = stop.get_token();
  auto call = correlator_->send(methods::CallTool, std::nullopt,
                                std::move(options));

  EXPECT_THROW(call.result.get(), CancelledException);
  EXPECT_EQ(transport_->countSent(methods::CallTool), 0u);
  EXPECT_EQ(transport_->countSent(methods::Cancelled), 0u);
}

TEST_F(RequestCorrelatorTest, TransportFailureSettlesWithTransportError) {
  using ::testing::_;
  ON_CALL(*transport_, send(_, ::testing::An<std::chrono::milliseconds>()))
      .WillByDefault(::testing::Return(
          std::make_error_code(std::errc::broken_pipe)));

  auto call = correlator_->send(methods::CallTool, std::nullopt, {});
  EXPECT_THROW(call.result.get(), TransportException);
  EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, PeerErrorKeepsItsKind) {
  auto call = correlator_->send(methods::CreateMessage, std::nullopt, {});

  types::JSONRPCError error;
  error.id = call.id;
  error.error = {static_cast<int>(types::ErrorCode::Declined), "declined",
                 nullptr};
  EXPECT_TRUE(correlator_->handleError(error));
  EXPECT_THROW(call.result.get(), DeclinedException);
}

TEST_F(RequestCorrelatorTest, AbortAllFailsEveryPendingRequest) {
  auto first = correlator_->send(methods::CallTool, std::nullopt, {});
  auto second = correlator_->send(methods::ListTools, std::nullopt, {});

  correlator_->abortAll("Connection closed");

  for (auto *future : {&first.result, &second.result}) {
    try {
      future->get();
      FAIL() << "Expected TransportException";
    } catch (const TransportException &e) {
      EXPECT_TRUE(e.is(types::ErrorCode::ConnectionClosed));
    }
  }
  EXPECT_EQ(correlator_->pendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, PeerCancellationStopsInboundWork) {
  auto stop = correlator_->registerInbound(7, methods::CreateMessage);
  EXPECT_FALSE(stop.stop_requested());

  EXPECT_FALSE(correlator_->handleCancelledNotification({8, std::nullopt}));
  EXPECT_TRUE(correlator_->handleCancelledNotification({7, "changed mind"}));
  EXPECT_TRUE(stop.stop_requested());
  EXPECT_EQ(correlator_->inboundCount(), 0u);
}

TEST_F(RequestCorrelatorTest, CompletedInboundIgnoresLateCancel) {
  correlator_->registerInbound(std::string("a"), methods::Elicit);
  correlator_->completeInbound(std::string("a"));

  EXPECT_FALSE(correlator_->handleCancelledNotification(
      {std::string("a"), std::nullopt}));
}
