#include "mcphub/types.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace mcphub::types;
using json = nlohmann::json;

class TypesTest : public ::testing::Test {};

TEST_F(TypesTest, RequestIdKeepsWireType) {
  RequestId numeric = 7;
  RequestId text = std::string("abc");

  EXPECT_EQ(json(numeric), 7);
  EXPECT_EQ(json(text), "abc");
  EXPECT_EQ(requestIdToString(numeric), "7");
  EXPECT_EQ(requestIdToString(text), "abc");

  auto parsed = json(42).get<RequestId>();
  ASSERT_TRUE(std::holds_alternative<int>(parsed));
  EXPECT_EQ(std::get<int>(parsed), 42);
}

TEST_F(TypesTest, TaskStatusWireNames) {
  EXPECT_EQ(json(TaskStatus::InputRequired), "input_required");
  EXPECT_EQ(json("cancelled").get<TaskStatus>(), TaskStatus::Cancelled);
  EXPECT_FALSE(taskStatusFromString("done").has_value());
  EXPECT_THROW(json("done").get<TaskStatus>(), std::invalid_argument);
}

TEST_F(TypesTest, TerminalStatuses) {
  EXPECT_FALSE(isTerminal(TaskStatus::Working));
  EXPECT_FALSE(isTerminal(TaskStatus::InputRequired));
  EXPECT_TRUE(isTerminal(TaskStatus::Completed));
  EXPECT_TRUE(isTerminal(TaskStatus::Failed));
  EXPECT_TRUE(isTerminal(TaskStatus::Cancelled));
}

TEST_F(TypesTest, TaskDescriptorOmitsUnsetFields) {
  TaskDescriptor task;
  task.taskId = "t1";
  task.status = TaskStatus::Working;
  task.pollInterval = 250;

  json j = task;
  EXPECT_EQ(j["taskId"], "t1");
  EXPECT_EQ(j["status"], "working");
  EXPECT_EQ(j["pollInterval"], 250);
  EXPECT_FALSE(j.contains("statusMessage"));
  EXPECT_FALSE(j.contains("ttl"));

  EXPECT_EQ(j.get<TaskDescriptor>(), task);
}

TEST_F(TypesTest, TaskDescriptorAcceptsNullTtl) {
  auto task = json{{"taskId", "t1"}, {"status", "completed"}, {"ttl", nullptr}}
                  .get<TaskDescriptor>();
  EXPECT_EQ(task.status, TaskStatus::Completed);
  EXPECT_FALSE(task.ttl.has_value());
}

TEST_F(TypesTest, NumericProgressTokenIsTrackedAsText) {
  auto params =
      json{{"progressToken", 12}, {"progress", 3}}.get<ProgressParams>();
  EXPECT_EQ(params.progressToken, "12");
  EXPECT_DOUBLE_EQ(params.progress, 3);
  EXPECT_FALSE(params.total.has_value());
}

TEST_F(TypesTest, ToolExecutionHint) {
  auto tool = json::parse(R"({
    "name": "render",
    "inputSchema": {"type": "object"},
    "execution": {"taskSupport": "required"}
  })")
                  .get<Tool>();
  ASSERT_TRUE(tool.taskSupport.has_value());
  EXPECT_EQ(*tool.taskSupport, TaskSupport::Required);

  auto plain = json{{"name", "echo"}}.get<Tool>();
  EXPECT_FALSE(plain.taskSupport.has_value());
  EXPECT_TRUE(plain.inputSchema.is_object());
}

TEST_F(TypesTest, TaskMetadataOnlyCarriesTtlWhenSet) {
  EXPECT_EQ(json(TaskMetadata{}), json::object());
  EXPECT_EQ(json(TaskMetadata{60000})["ttl"], 60000);
}

TEST_F(TypesTest, ListTasksResultCursor) {
  ListTasksResult page;
  page.tasks.push_back({.taskId = "a"});
  page.nextCursor = "1";

  json j = page;
  EXPECT_EQ(j["tasks"].size(), 1u);
  EXPECT_EQ(j["nextCursor"], "1");

  auto last = json{{"tasks", json::array()}}.get<ListTasksResult>();
  EXPECT_FALSE(last.nextCursor.has_value());
}
