#include "mcphub/utils/error.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace mcphub;
using namespace mcphub::types;
using json = nlohmann::json;

class ErrorTest : public ::testing::Test {
protected:
  template <typename T> static void expectRethrownAs(const ErrorData &error) {
    try {
      std::rethrow_exception(exceptionFromError(error));
    } catch (const T &e) {
      EXPECT_EQ(e.error().code, error.code);
      EXPECT_EQ(e.error().message, error.message);
      return;
    } catch (const std::exception &e) {
      FAIL() << "Unexpected exception type for code " << error.code << ": "
             << e.what();
    }
  }
};

TEST_F(ErrorTest, HubExceptionWithErrorData) {
  ErrorData error_data{.code = static_cast<int>(ErrorCode::InvalidParams),
                       .message = "Invalid parameters",
                       .data = json{{"param", "value"}}};

  HubException exception(error_data);

  EXPECT_EQ(exception.what(), std::string("Invalid parameters"));
  EXPECT_EQ(exception.error().code, static_cast<int>(ErrorCode::InvalidParams));
  EXPECT_EQ(exception.error().data["param"], "value");
  EXPECT_TRUE(exception.is(ErrorCode::InvalidParams));
  EXPECT_FALSE(exception.is(ErrorCode::InternalError));
}

TEST_F(ErrorTest, TransportExceptionDefaultsToTransportError) {
  TransportException exception("Transport error",
                               json{{"details", "connection failed"}});

  EXPECT_EQ(exception.what(), std::string("Transport error"));
  EXPECT_TRUE(exception.is(ErrorCode::TransportError));
  EXPECT_EQ(exception.error().data["details"], "connection failed");
}

TEST_F(ErrorTest, TransportExceptionFromErrorCode) {
  TransportException exception(
      std::make_error_code(std::errc::connection_reset));

  EXPECT_TRUE(exception.is(ErrorCode::TransportError));
  EXPECT_EQ(exception.error().data["value"],
            static_cast<int>(std::errc::connection_reset));
}

TEST_F(ErrorTest, TeardownUsesConnectionClosed) {
  TransportException exception(ErrorCode::ConnectionClosed, "Connection closed");
  EXPECT_TRUE(exception.is(ErrorCode::ConnectionClosed));
}

TEST_F(ErrorTest, TaskExceptionsCarryTaskId) {
  TaskNotFoundException not_found("abc");
  EXPECT_TRUE(not_found.is(ErrorCode::TaskNotFound));
  EXPECT_EQ(not_found.error().data["taskId"], "abc");

  InvalidTaskTransitionException transition("abc", TaskStatus::Completed,
                                            TaskStatus::Cancelled);
  EXPECT_TRUE(transition.is(ErrorCode::InvalidTaskTransition));
  EXPECT_EQ(transition.error().data["from"], "completed");
  EXPECT_EQ(transition.error().data["to"], "cancelled");

  TaskFailedException failed("abc", "boom");
  EXPECT_EQ(failed.what(), std::string("boom"));
  EXPECT_TRUE(failed.is(ErrorCode::TaskFailed));
}

TEST_F(ErrorTest, NotCancellableHasDistinctCode) {
  NotCancellableException exception("1", "initialize");
  EXPECT_TRUE(exception.is(ErrorCode::NotCancellable));
  EXPECT_NE(exception.error().code,
            static_cast<int>(ErrorCode::RequestCancelled));
  EXPECT_EQ(exception.error().data["method"], "initialize");
}

TEST_F(ErrorTest, CancelledExceptionDefaultMessage) {
  CancelledException exception;
  EXPECT_EQ(exception.what(), std::string("Request cancelled"));
  EXPECT_TRUE(exception.is(ErrorCode::RequestCancelled));
}

TEST_F(ErrorTest, ExceptionFromErrorKeepsOutcomesDistinguishable) {
  auto make = [](ErrorCode code) {
    return ErrorData{static_cast<int>(code), "message", nullptr};
  };

  expectRethrownAs<DeclinedException>(make(ErrorCode::Declined));
  expectRethrownAs<CancelledException>(make(ErrorCode::RequestCancelled));
  expectRethrownAs<TimeoutException>(make(ErrorCode::TimeoutError));
  expectRethrownAs<TransportException>(make(ErrorCode::ConnectionClosed));
  expectRethrownAs<TaskNotFoundException>(make(ErrorCode::TaskNotFound));
  expectRethrownAs<InvalidTaskTransitionException>(
      make(ErrorCode::InvalidTaskTransition));
  expectRethrownAs<CapabilityException>(make(ErrorCode::CapabilityError));
  expectRethrownAs<ProtocolException>(make(ErrorCode::MethodNotFound));
  expectRethrownAs<ProtocolException>(ErrorData{-1, "custom", nullptr});
}

TEST_F(ErrorTest, CreateErrorResponseFromException) {
  HubException exception(ErrorCode::InvalidParams, "Invalid parameters");

  JSONRPCError error_response = createErrorResponse("request1", exception);

  EXPECT_EQ(error_response.jsonrpc, "2.0");
  EXPECT_EQ(std::get<std::string>(error_response.id), "request1");
  EXPECT_EQ(error_response.error.code,
            static_cast<int>(ErrorCode::InvalidParams));
  EXPECT_EQ(error_response.error.message, "Invalid parameters");
}

TEST_F(ErrorTest, CreateErrorResponseFromErrorData) {
  ErrorData error_data{.code = static_cast<int>(ErrorCode::Declined),
                       .message = "User declined sampling request",
                       .data = nullptr};

  JSONRPCError error_response = createErrorResponse(123, error_data);

  EXPECT_EQ(std::get<int>(error_response.id), 123);
  EXPECT_EQ(error_response.error.code, static_cast<int>(ErrorCode::Declined));
}

TEST_F(ErrorTest, CreateErrorResponseFromErrorCodeAndMessage) {
  JSONRPCError error_response =
      createErrorResponse("request1", ErrorCode::MethodNotFound,
                          "Method not found", json{{"method", "x"}});

  EXPECT_EQ(std::get<std::string>(error_response.id), "request1");
  EXPECT_EQ(error_response.error.code,
            static_cast<int>(ErrorCode::MethodNotFound));
  EXPECT_EQ(error_response.error.data["method"], "x");
}
