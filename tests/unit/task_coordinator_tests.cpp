#include "mcphub/methods.hpp"
#include "mcphub/session/task_coordinator.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/ids.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <set>
#include <thread>

using namespace mcphub;
using namespace mcphub::session;
using types::TaskDescriptor;
using types::TaskStatus;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Scripted peer answering the task methods
 */
class ScriptedPeer {
public:
  void queueStatus(TaskStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    statuses_.push_back(status);
  }

  void setPollInterval(int interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    poll_interval_ = interval;
  }

  void failCancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_cancel_ = true;
  }

  json operator()(const std::string &method, const json &params) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_[method];
    const std::string task_id = params.value("taskId", "");
    if (method == methods::GetTask) {
      if (statuses_.size() > 1) {
        current_ = statuses_.front();
        statuses_.pop_front();
      } else if (!statuses_.empty()) {
        current_ = statuses_.front();
      }
      return json{{"taskId", task_id},
                  {"status", current_},
                  {"pollInterval", poll_interval_}};
    }
    if (method == methods::TaskResult) {
      return json{{"content", json::array({{{"type", "text"}, {"text", "done"}}})}};
    }
    if (method == methods::CancelTask) {
      if (fail_cancel_) {
        throw TransportException(types::ErrorCode::ConnectionClosed, "gone");
      }
      return json{{"taskId", task_id}, {"status", "cancelled"}};
    }
    if (method == methods::ListTasks) {
      return json{{"tasks", json::array()}, {"nextCursor", "next"}};
    }
    throw ProtocolException(types::ErrorCode::MethodNotFound, method);
  }

  int calls(const std::string &method) {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_[method];
  }

private:
  std::mutex mutex_;
  std::deque<TaskStatus> statuses_;
  TaskStatus current_ = TaskStatus::Working;
  int poll_interval_ = 5;
  bool fail_cancel_ = false;
  std::map<std::string, int> calls_;
};

TaskDescriptor working(const std::string &task_id) {
  TaskDescriptor task;
  task.taskId = task_id;
  task.status = TaskStatus::Working;
  task.pollInterval = 5;
  return task;
}

const TaskStatus kStatuses[] = {TaskStatus::Working, TaskStatus::InputRequired,
                                TaskStatus::Completed, TaskStatus::Failed,
                                TaskStatus::Cancelled};

} // namespace

TEST(TaskStateMachineTest, AllowedTransitions) {
  EXPECT_TRUE(canTransition(TaskStatus::Working, TaskStatus::InputRequired));
  EXPECT_TRUE(canTransition(TaskStatus::Working, TaskStatus::Completed));
  EXPECT_TRUE(canTransition(TaskStatus::InputRequired, TaskStatus::Working));
  EXPECT_TRUE(canTransition(TaskStatus::InputRequired, TaskStatus::Cancelled));
  EXPECT_FALSE(canTransition(TaskStatus::Working, TaskStatus::Working));
  for (auto to : kStatuses) {
    EXPECT_FALSE(canTransition(TaskStatus::Completed, to));
    EXPECT_FALSE(canTransition(TaskStatus::Failed, to));
    EXPECT_FALSE(canTransition(TaskStatus::Cancelled, to));
  }
}

class InitiatorTaskCoordinatorTest : public ::testing::Test {
protected:
  InitiatorTaskCoordinatorTest()
      : coordinator_(
            [this](const std::string &method, const json &params) {
              return peer_(method, params);
            },
            progress_, scheduler_, "test") {}

  void TearDown() override { scheduler_.shutdown(); }

  TaskWaitOptions fastWait() {
    TaskWaitOptions options;
    options.timeout = 2s;
    options.default_poll_interval = 5ms;
    return options;
  }

  utils::Scheduler scheduler_;
  ProgressTracker progress_{"test"};
  ScriptedPeer peer_;
  InitiatorTaskCoordinator coordinator_;
};

TEST_F(InitiatorTaskCoordinatorTest, PollsUntilCompletedAndFetchesResultOnce) {
  peer_.queueStatus(TaskStatus::Working);
  peer_.queueStatus(TaskStatus::Working);
  peer_.queueStatus(TaskStatus::Completed);
  coordinator_.track(working("t1"));

  std::vector<TaskStatus> observed;
  auto options = fastWait();
  options.on_status = [&](const TaskDescriptor &task) {
    observed.push_back(task.status);
  };
  json result = coordinator_.awaitResult("t1", options);

  EXPECT_EQ(result["content"][0]["text"], "done");
  EXPECT_EQ(peer_.calls(methods::GetTask), 3);
  EXPECT_EQ(peer_.calls(methods::TaskResult), 1);
  EXPECT_EQ(observed.front(), TaskStatus::Working);
  EXPECT_EQ(observed.back(), TaskStatus::Completed);
  EXPECT_EQ(coordinator_.size(), 0u);
}

TEST_F(InitiatorTaskCoordinatorTest, PushedStatusStopsPolling) {
  auto task = working("t1");
  task.pollInterval.reset();
  coordinator_.track(task);

  auto pusher = std::async(std::launch::async, [this]() {
    std::this_thread::sleep_for(20ms);
    auto update = working("t1");
    update.status = TaskStatus::Completed;
    coordinator_.applyStatus(update, true);
  });

  auto options = fastWait();
  options.default_poll_interval = 1s;

  EXPECT_NO_THROW(coordinator_.awaitResult("t1", options));
  pusher.get();
  EXPECT_EQ(peer_.calls(methods::GetTask), 0);
  EXPECT_EQ(peer_.calls(methods::TaskResult), 1);
}

TEST_F(InitiatorTaskCoordinatorTest, FailedTaskThrowsAndIsForgotten) {
  peer_.queueStatus(TaskStatus::Failed);
  coordinator_.track(working("t1"));

  EXPECT_THROW(coordinator_.awaitResult("t1", fastWait()), TaskFailedException);
  EXPECT_EQ(peer_.calls(methods::TaskResult), 0);
  EXPECT_FALSE(coordinator_.local("t1").has_value());
}

TEST_F(InitiatorTaskCoordinatorTest, FetchingResultForgetsTask) {
  coordinator_.track(working("t1"));
  auto update = working("t1");
  update.status = TaskStatus::Completed;
  coordinator_.applyStatus(update, true);

  EXPECT_NO_THROW(coordinator_.result("t1"));
  EXPECT_EQ(coordinator_.size(), 0u);
}

TEST_F(InitiatorTaskCoordinatorTest, InputRequiredWithoutHandlerThrows) {
  auto task = working("t1");
  task.status = TaskStatus::InputRequired;
  coordinator_.track(task);

  EXPECT_THROW(coordinator_.awaitResult("t1", fastWait()),
               InputRequiredException);
}

TEST_F(InitiatorTaskCoordinatorTest, InputRequiredSignalledOncePerEntry) {
  peer_.queueStatus(TaskStatus::InputRequired);
  peer_.queueStatus(TaskStatus::InputRequired);
  peer_.queueStatus(TaskStatus::Working);
  peer_.queueStatus(TaskStatus::InputRequired);
  peer_.queueStatus(TaskStatus::Completed);
  coordinator_.track(working("t1"));

  int signalled = 0;
  auto options = fastWait();
  options.on_input_required = [&](const TaskDescriptor &task) {
    EXPECT_EQ(task.status, TaskStatus::InputRequired);
    ++signalled;
  };

  EXPECT_NO_THROW(coordinator_.awaitResult("t1", options));
  EXPECT_EQ(signalled, 2);
}

TEST_F(InitiatorTaskCoordinatorTest, IllegalPushedTransitionIsIgnored) {
  coordinator_.track(working("t1"));
  auto update = working("t1");
  update.status = TaskStatus::Completed;
  ASSERT_TRUE(coordinator_.applyStatus(update, true));

  update.status = TaskStatus::Working;
  EXPECT_FALSE(coordinator_.applyStatus(update, true));
  EXPECT_EQ(coordinator_.local("t1")->status, TaskStatus::Completed);
}

TEST_F(InitiatorTaskCoordinatorTest, CancelOfTerminalTaskSendsNothing) {
  coordinator_.track(working("t1"));
  auto update = working("t1");
  update.status = TaskStatus::Completed;
  coordinator_.applyStatus(update, true);

  EXPECT_THROW(coordinator_.cancel("t1"), InvalidTaskTransitionException);
  EXPECT_EQ(peer_.calls(methods::CancelTask), 0);
  EXPECT_EQ(coordinator_.local("t1")->status, TaskStatus::Completed);
}

TEST_F(InitiatorTaskCoordinatorTest, CancelMarksTaskCancelledAndReleasesToken) {
  auto token = progress_.issueToken({ProgressOwner::Kind::Request, "r1"});
  coordinator_.track(working("t1"), token);
  EXPECT_EQ(progress_.snapshot(token)->owner.kind, ProgressOwner::Kind::Task);

  auto descriptor = coordinator_.cancel("t1");
  EXPECT_EQ(descriptor.status, TaskStatus::Cancelled);
  EXPECT_FALSE(coordinator_.local("t1").has_value());
  EXPECT_EQ(coordinator_.size(), 0u);
  EXPECT_FALSE(progress_.snapshot(token).has_value());
}

TEST_F(InitiatorTaskCoordinatorTest, CancelWakesWaiterWithCancelled) {
  auto task = working("t1");
  task.pollInterval.reset();
  coordinator_.track(task);

  auto options = fastWait();
  options.default_poll_interval = 1s;
  auto waiter = std::async(std::launch::async, [this, options]() {
    return coordinator_.awaitResult("t1", options);
  });
  std::this_thread::sleep_for(20ms);
  coordinator_.cancel("t1");

  EXPECT_THROW(waiter.get(), CancelledException);
  EXPECT_EQ(coordinator_.size(), 0u);
}

TEST_F(InitiatorTaskCoordinatorTest, StopTokenCancelsTheWait) {
  coordinator_.track(working("t1"));
  std::stop_source stop;
  auto options = fastWait();
  options.stop_token = stop.get_token();

  auto stopper = std::async(std::launch::async, [&stop]() {
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
  });

  EXPECT_THROW(coordinator_.awaitResult("t1", options), CancelledException);
  stopper.get();
  EXPECT_EQ(peer_.calls(methods::CancelTask), 1);
  EXPECT_EQ(coordinator_.size(), 0u);
}

TEST_F(InitiatorTaskCoordinatorTest, StoppedWaitForgetsTaskWhenCancelFails) {
  peer_.failCancel();
  auto token = progress_.issueToken({ProgressOwner::Kind::Request, "r1"});
  coordinator_.track(working("t1"), token);
  std::stop_source stop;
  stop.request_stop();
  auto options = fastWait();
  options.stop_token = stop.get_token();

  EXPECT_THROW(coordinator_.awaitResult("t1", options), CancelledException);
  EXPECT_EQ(peer_.calls(methods::CancelTask), 1);
  EXPECT_FALSE(coordinator_.local("t1").has_value());
  EXPECT_FALSE(progress_.snapshot(token).has_value());
}

TEST_F(InitiatorTaskCoordinatorTest, ZeroPollIntervalFallsBackToDefault) {
  peer_.setPollInterval(0);
  auto task = working("t1");
  task.pollInterval = 0;
  coordinator_.track(task);

  auto options = fastWait();
  options.timeout = 100ms;
  options.default_poll_interval = 20ms;

  EXPECT_THROW(coordinator_.awaitResult("t1", options), TimeoutException);
  EXPECT_GE(peer_.calls(methods::GetTask), 1);
  EXPECT_LE(peer_.calls(methods::GetTask), 10);
}

TEST_F(InitiatorTaskCoordinatorTest, OverallTimeoutIsIndependentOfPolling) {
  coordinator_.track(working("t1"));
  auto options = fastWait();
  options.timeout = 40ms;

  EXPECT_THROW(coordinator_.awaitResult("t1", options), TimeoutException);
  EXPECT_TRUE(coordinator_.local("t1").has_value());
}

TEST_F(InitiatorTaskCoordinatorTest, TtlExpiryDropsRecord) {
  auto task = working("t1");
  task.ttl = 20;
  coordinator_.track(task);

  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(coordinator_.local("t1").has_value());
  EXPECT_THROW(coordinator_.awaitResult("t1", fastWait()),
               TaskNotFoundException);
}

TEST_F(InitiatorTaskCoordinatorTest, ListPassesCursorThrough) {
  auto page = coordinator_.list("abc");
  EXPECT_EQ(page.nextCursor.value_or(""), "next");
}

class ReceiverTaskCoordinatorTest : public ::testing::Test {
protected:
  ReceiverTaskCoordinatorTest() : coordinator_(scheduler_, notifier(), config(), "test") {}

  void TearDown() override { scheduler_.shutdown(); }

  static ReceiverTaskConfig config() {
    ReceiverTaskConfig config;
    config.page_size = 2;
    return config;
  }

  ReceiverTaskCoordinator::StatusNotifier notifier() {
    return [this](const TaskDescriptor &task) {
      std::lock_guard<std::mutex> lock(mutex_);
      published_.push_back(task);
    };
  }

  std::size_t publishedCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_.size();
  }

  const std::string scope_ = "session-a";
  std::mutex mutex_;
  std::vector<TaskDescriptor> published_;
  utils::Scheduler scheduler_;
  ReceiverTaskCoordinator coordinator_;
};

TEST_F(ReceiverTaskCoordinatorTest, CreateStartsWorking) {
  auto task = coordinator_.create(scope_, {});

  EXPECT_EQ(task.status, TaskStatus::Working);
  EXPECT_EQ(task.taskId.size(), 32u);
  EXPECT_EQ(task.ttl, std::chrono::milliseconds(std::chrono::minutes(10)).count());
  EXPECT_TRUE(task.createdAt.has_value());
  EXPECT_EQ(task.createdAt, task.lastUpdatedAt);
}

TEST_F(ReceiverTaskCoordinatorTest, TaskIdsAreUnique) {
  std::set<std::string> ids;
  for (int i = 0; i < 10000; ++i) {
    ids.insert(ids::newTaskId());
  }
  EXPECT_EQ(ids.size(), 10000u);
}

TEST_F(ReceiverTaskCoordinatorTest, RequestedTtlIsClamped) {
  auto task = coordinator_.create(scope_, {std::int64_t{24} * 3600 * 1000});
  EXPECT_EQ(task.ttl, std::chrono::milliseconds(std::chrono::hours(1)).count());
}

TEST_F(ReceiverTaskCoordinatorTest, GetIsIdempotent) {
  auto task = coordinator_.create(scope_, {});
  EXPECT_EQ(coordinator_.get(task.taskId, scope_),
            coordinator_.get(task.taskId, scope_));
}

TEST_F(ReceiverTaskCoordinatorTest, RandomTransitionsFollowStateMachine) {
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> pick(0, 4);

  for (int round = 0; round < 200; ++round) {
    auto task = coordinator_.create(scope_, {});
    TaskStatus current = TaskStatus::Working;
    for (int step = 0; step < 6; ++step) {
      const TaskStatus next = kStatuses[pick(rng)];
      const bool allowed = canTransition(current, next) ||
                           (next == current && !types::isTerminal(current));
      if (allowed) {
        EXPECT_NO_THROW(coordinator_.transition(task.taskId, next));
        current = next;
      } else {
        EXPECT_THROW(coordinator_.transition(task.taskId, next),
                     InvalidTaskTransitionException);
      }
      EXPECT_EQ(coordinator_.get(task.taskId, scope_).status, current);
    }
  }
}

TEST_F(ReceiverTaskCoordinatorTest, EveryTransitionIsPublished) {
  auto task = coordinator_.create(scope_, {});
  coordinator_.transition(task.taskId, TaskStatus::InputRequired, "waiting");
  coordinator_.transition(task.taskId, TaskStatus::Working);
  coordinator_.complete(task.taskId, json{{"ok", true}});

  EXPECT_EQ(publishedCount(), 3u);
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(published_.back().status, TaskStatus::Completed);
}

TEST_F(ReceiverTaskCoordinatorTest, ResultBlocksUntilTerminalThenPurges) {
  auto task = coordinator_.create(scope_, {});

  auto worker = std::async(std::launch::async, [&]() {
    std::this_thread::sleep_for(20ms);
    coordinator_.complete(task.taskId, json{{"value", 42}});
  });

  auto result = coordinator_.result(task.taskId, scope_, 2s);
  worker.get();
  EXPECT_EQ(result["value"], 42);
  EXPECT_THROW(coordinator_.get(task.taskId, scope_), TaskNotFoundException);
}

TEST_F(ReceiverTaskCoordinatorTest, ResultRethrowsFailure) {
  auto task = coordinator_.create(scope_, {});
  coordinator_.fail(task.taskId,
                    {static_cast<int>(types::ErrorCode::Declined), "no", nullptr});

  EXPECT_THROW(coordinator_.result(task.taskId, scope_, 1s), DeclinedException);
}

TEST_F(ReceiverTaskCoordinatorTest, ResultHonoursTimeoutAndStop) {
  auto task = coordinator_.create(scope_, {});
  EXPECT_THROW(coordinator_.result(task.taskId, scope_, 20ms), TimeoutException);

  std::stop_source stop;
  stop.request_stop();
  EXPECT_THROW(coordinator_.result(task.taskId, scope_, 1s, stop.get_token()),
               CancelledException);
  EXPECT_EQ(coordinator_.get(task.taskId, scope_).status, TaskStatus::Working);
}

TEST_F(ReceiverTaskCoordinatorTest, CancelOfCompletedTaskIsRejected) {
  auto task = coordinator_.create(scope_, {});
  coordinator_.complete(task.taskId, json::object());

  EXPECT_THROW(coordinator_.cancel(task.taskId, scope_),
               InvalidTaskTransitionException);
  EXPECT_EQ(coordinator_.get(task.taskId, scope_).status,
            TaskStatus::Completed);
}

TEST_F(ReceiverTaskCoordinatorTest, CancelStopsWork) {
  auto task = coordinator_.create(scope_, {});
  auto work = coordinator_.workToken(task.taskId);

  auto cancelled = coordinator_.cancel(task.taskId, scope_);
  EXPECT_EQ(cancelled.status, TaskStatus::Cancelled);
  EXPECT_TRUE(work.stop_requested());
  EXPECT_THROW(coordinator_.complete(task.taskId, json::object()),
               InvalidTaskTransitionException);
}

TEST_F(ReceiverTaskCoordinatorTest, CreateHandsOutWorkToken) {
  std::stop_token work;
  auto task = coordinator_.create(scope_, {}, &work);
  EXPECT_TRUE(work.stop_possible());
  EXPECT_FALSE(work.stop_requested());

  coordinator_.cancel(task.taskId, scope_);
  EXPECT_TRUE(work.stop_requested());
}

TEST_F(ReceiverTaskCoordinatorTest, ZeroTtlTasksArePurged) {
  types::TaskMetadata metadata;
  metadata.ttl = 0;
  std::vector<std::stop_token> work(50);
  for (auto &token : work) {
    coordinator_.create(scope_, metadata, &token);
  }

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (coordinator_.size() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(coordinator_.size(), 0u);
  for (const auto &token : work) {
    EXPECT_TRUE(token.stop_requested());
  }
  EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(ReceiverTaskCoordinatorTest, ExpiredTaskIsNotFound) {
  auto task = coordinator_.create(scope_, {50});

  std::this_thread::sleep_for(100ms);
  EXPECT_THROW(coordinator_.get(task.taskId, scope_), TaskNotFoundException);
  EXPECT_THROW(coordinator_.cancel(task.taskId, scope_), TaskNotFoundException);
  EXPECT_THROW(coordinator_.result(task.taskId, scope_, 10ms),
               TaskNotFoundException);
}

TEST_F(ReceiverTaskCoordinatorTest, ForeignScopeSeesNothing) {
  auto task = coordinator_.create(scope_, {});

  EXPECT_THROW(coordinator_.get(task.taskId, "session-b"),
               TaskNotFoundException);
  EXPECT_THROW(coordinator_.cancel(task.taskId, "session-b"),
               TaskNotFoundException);
  EXPECT_TRUE(coordinator_.list("session-b").tasks.empty());
  EXPECT_EQ(coordinator_.get(task.taskId, scope_).status, TaskStatus::Working);
}

TEST_F(ReceiverTaskCoordinatorTest, ListPagesInCreationOrder) {
  std::vector<std::string> created;
  for (int i = 0; i < 5; ++i) {
    created.push_back(coordinator_.create(scope_, {}).taskId);
  }
  coordinator_.create("session-b", {});

  std::vector<std::string> listed;
  std::optional<std::string> cursor;
  int pages = 0;
  do {
    auto page = coordinator_.list(scope_, cursor);
    for (const auto &task : page.tasks) {
      listed.push_back(task.taskId);
    }
    cursor = page.nextCursor;
    ++pages;
  } while (cursor);

  EXPECT_EQ(listed, created);
  EXPECT_EQ(pages, 3);
  EXPECT_THROW(coordinator_.list(scope_, std::string("bogus")),
               ProtocolException);
}

TEST_F(ReceiverTaskCoordinatorTest, FailAllWakesWaiters) {
  auto task = coordinator_.create(scope_, {});

  auto waiter = std::async(std::launch::async, [&]() {
    return coordinator_.result(task.taskId, scope_, 2s);
  });
  std::this_thread::sleep_for(20ms);
  coordinator_.failAll("Connection closed");

  EXPECT_THROW(waiter.get(), TaskNotFoundException);
  EXPECT_EQ(coordinator_.size(), 0u);
}
