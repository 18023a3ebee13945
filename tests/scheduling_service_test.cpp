#include "tickback/app/scheduling_service.hpp"
#include "tickback/executor/callback_executor.hpp"
#include "tickback/storage/memory_task_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace tickback;
using tickback::test::FailingStore;
using tickback::test::kBaseTime;
using tickback::test::ManualClock;
using tickback::test::RecordingSleeper;
using tickback::test::ScriptedTransport;

class SchedulingServiceTest : public ::testing::Test {
protected:
  SchedulingServiceTest() : service_(store_, clock_.clock(), 3) {
  }

  auto create(std::string trigger_at, std::string tag = "billing")
      -> Task {
    CreateTaskRequest req;
    req.trigger_at = std::move(trigger_at);
    req.tag = std::move(tag);
    req.callback = "http://127.0.0.1:9/hook";
    auto task = service_.create(req);
    EXPECT_TRUE(task.has_value());
    return task.value_or(Task{});
  }

  auto set_state(Task task, TaskState state) -> Task {
    task.state = state;
    EXPECT_TRUE(store_.put(to_row(task)).has_value());
    return task;
  }

  auto ref(std::string_view text) -> TaskRef {
    return parse_task_ref(text).value();
  }

  MemoryTaskStore store_;
  ManualClock clock_{kBaseTime + 20};
  SchedulingService service_;
};

TEST_F(SchedulingServiceTest, CreatePersistsPendingTask) {
  auto task = create("+2m");

  EXPECT_EQ(task.trigger_at, kBaseTime + 120);
  auto row = store_.get(task.key());
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->state, TaskState::Pending);
}

TEST_F(SchedulingServiceTest, CreateValidationError) {
  CreateTaskRequest req;
  req.trigger_at = "+1m";
  req.tag = "bad-tag";
  req.callback = "http://h/";

  auto task = service_.create(req);

  ASSERT_FALSE(task.has_value());
  EXPECT_EQ(task.error(), Error::InvalidTag);
  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(SchedulingServiceTest, CreateStorageFailure) {
  FailingStore failing(store_);
  failing.fail_put = true;
  SchedulingService service(failing, clock_.clock(), 10);
  CreateTaskRequest req;
  req.trigger_at = "+1m";
  req.tag = "t";
  req.callback = "http://h/";

  auto task = service.create(req);

  ASSERT_FALSE(task.has_value());
  EXPECT_EQ(task.error(), Error::StorageError);
}

TEST_F(SchedulingServiceTest, RescheduleMovesOnlyFailedByDefault) {
  auto failed = set_state(create("+1m"), TaskState::Failed);
  set_state(create("+2m"), TaskState::Successful);
  create("+3m");

  auto moved = service_.reschedule(ref("billing"), "+10m", false);

  ASSERT_TRUE(moved.has_value());
  ASSERT_EQ(moved->size(), 1u);
  EXPECT_EQ((*moved)[0].unique_id, failed.unique_id);
  EXPECT_EQ((*moved)[0].trigger_at, kBaseTime + 600);
  EXPECT_EQ((*moved)[0].state, TaskState::Failed);

  // The old occurrence stays where it was.
  EXPECT_TRUE(store_.get(failed.key()).has_value());
  EXPECT_EQ(store_.size(), 4u);
}

TEST_F(SchedulingServiceTest, RescheduleAllMovesEveryOccurrence) {
  set_state(create("+1m"), TaskState::Failed);
  set_state(create("+2m"), TaskState::Successful);
  create("+3m");
  create("+1m", "other");

  auto moved = service_.reschedule(ref("billing"), std::nullopt, true);

  ASSERT_TRUE(moved.has_value());
  EXPECT_EQ(moved->size(), 3u);
  for (const auto& task : *moved) {
    EXPECT_EQ(task.tag, "billing");
    EXPECT_EQ(task.trigger_at, kBaseTime + 60);
  }
}

TEST_F(SchedulingServiceTest, RescheduleAllRevivesStuckRunningTask) {
  auto stuck = set_state(create("+1m"), TaskState::Running);

  auto moved = service_.reschedule(ref(stuck.id()), "+5m", true);

  ASSERT_TRUE(moved.has_value());
  ASSERT_EQ(moved->size(), 1u);
  auto copy = (*moved)[0];
  EXPECT_EQ(copy.state, TaskState::Pending);
  EXPECT_EQ(store_.get(copy.key())->state, TaskState::Pending);
  EXPECT_EQ(store_.get(stuck.key())->state, TaskState::Running);

  ScriptedTransport transport;
  RecordingSleeper sleeper;
  CallbackExecutor executor(store_, transport, clock_.clock(),
                            sleeper.sleeper());
  clock_.set(copy.trigger_at);

  EXPECT_EQ(executor.execute(copy), ExecutionOutcome::Succeeded);
  EXPECT_EQ(transport.calls(), 1u);
  EXPECT_EQ(store_.get(copy.key())->state, TaskState::Successful);
}

TEST_F(SchedulingServiceTest, RescheduleExactTask) {
  auto failed = set_state(create("+1m"), TaskState::Failed);
  set_state(create("+1m"), TaskState::Failed);

  auto moved = service_.reschedule(ref(failed.id()), "+5m", false);

  ASSERT_TRUE(moved.has_value());
  ASSERT_EQ(moved->size(), 1u);
  EXPECT_EQ((*moved)[0].unique_id, failed.unique_id);
}

TEST_F(SchedulingServiceTest, RescheduleByUniqueIdAcrossMinutes) {
  auto first = set_state(create("+1m"), TaskState::Failed);
  auto moved_once = service_.reschedule(ref(first.id()), "+5m", false);
  ASSERT_TRUE(moved_once.has_value());

  auto moved = service_.reschedule(
      ref("billing+" + first.unique_id), "+20m", false);

  ASSERT_TRUE(moved.has_value());
  EXPECT_EQ(moved->size(), 2u);
}

TEST_F(SchedulingServiceTest, RescheduleErrors) {
  EXPECT_EQ(service_.reschedule(TaskRef{}, std::nullopt, false).error(),
            Error::InvalidTaskRef);
  EXPECT_EQ(service_.reschedule(ref("billing"), "yesterday", false).error(),
            Error::InvalidTimeSpec);
  EXPECT_EQ(service_
                .reschedule(ref("billing+abc@" + std::to_string(kBaseTime)),
                            std::nullopt, false)
                .error(),
            Error::NotFound);

  auto moved = service_.reschedule(ref("nothing"), std::nullopt, true);
  ASSERT_TRUE(moved.has_value());
  EXPECT_TRUE(moved->empty());
}

TEST_F(SchedulingServiceTest, RescheduleLookupAndWriteFailures) {
  set_state(create("+1m"), TaskState::Failed);
  FailingStore failing(store_);
  SchedulingService service(failing, clock_.clock(), 10);

  failing.fail_query_by_tag = true;
  EXPECT_EQ(service.reschedule(ref("billing"), std::nullopt, false).error(),
            Error::LookupFailed);

  failing.fail_query_by_tag = false;
  failing.fail_put = true;
  EXPECT_EQ(service.reschedule(ref("billing"), std::nullopt, false).error(),
            Error::StorageError);
}

TEST_F(SchedulingServiceTest, StatusExactTask) {
  auto task = create("+1m");

  auto page = service_.status(ref(task.id()), std::nullopt, false);

  ASSERT_TRUE(page.has_value());
  ASSERT_EQ(page->tasks.size(), 1u);
  EXPECT_EQ(page->tasks[0].id(), task.id());
  EXPECT_FALSE(page->next);
}

TEST_F(SchedulingServiceTest, StatusNotFound) {
  auto missing = service_.status(
      ref("billing+abc@" + std::to_string(kBaseTime + 60)), std::nullopt,
      false);
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);

  auto empty_minute = service_.status(
      ref("billing@" + std::to_string(kBaseTime + 60)), std::nullopt, false);
  ASSERT_FALSE(empty_minute.has_value());
  EXPECT_EQ(empty_minute.error(), Error::NotFound);

  auto empty_tag = service_.status(ref("billing"), std::nullopt, false);
  ASSERT_TRUE(empty_tag.has_value());
  EXPECT_TRUE(empty_tag->tasks.empty());
}

TEST_F(SchedulingServiceTest, StatusPagesByTagAreDisjoint) {
  for (int i = 0; i < 7; ++i) {
    create(std::format("+{}m", 1 + i % 3));
  }
  create("+1m", "other");

  std::set<std::string> seen;
  std::optional<TaskKey> cursor;
  int pages = 0;
  do {
    auto page = service_.status(ref("billing"), cursor, false);
    ASSERT_TRUE(page.has_value());
    EXPECT_LE(page->tasks.size(), service_.page_size());
    for (const auto& task : page->tasks) {
      EXPECT_EQ(task.tag, "billing");
      EXPECT_TRUE(seen.insert(task.id()).second);
    }
    cursor = page->next;
    ++pages;
  } while (cursor && pages < 10);

  EXPECT_EQ(seen.size(), 7u);
}

TEST_F(SchedulingServiceTest, StatusScanAcrossTags) {
  create("+1m", "a");
  create("+1m", "b");
  create("+2m", "c");
  create("+3m", "d");

  std::set<std::string> seen;
  std::optional<TaskKey> cursor;
  int pages = 0;
  do {
    auto page = service_.status(TaskRef{}, cursor, false);
    ASSERT_TRUE(page.has_value());
    for (const auto& task : page->tasks) {
      EXPECT_TRUE(seen.insert(task.id()).second);
    }
    cursor = page->next;
    ++pages;
  } while (cursor && pages < 10);

  EXPECT_EQ(seen.size(), 4u);
  EXPECT_EQ(pages, 2);
}

TEST_F(SchedulingServiceTest, StatusFutureOnly) {
  auto past = create("+1m");
  create("+5m");
  clock_.set(kBaseTime + 3 * 60 + 10);

  auto by_tag = service_.status(ref("billing"), std::nullopt, true);
  ASSERT_TRUE(by_tag.has_value());
  ASSERT_EQ(by_tag->tasks.size(), 1u);
  EXPECT_NE(by_tag->tasks[0].id(), past.id());

  auto all = service_.status(TaskRef{}, std::nullopt, true);
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->tasks.size(), 1u);

  auto everything = service_.status(ref("billing"), std::nullopt, false);
  ASSERT_TRUE(everything.has_value());
  EXPECT_EQ(everything->tasks.size(), 2u);
}

TEST_F(SchedulingServiceTest, StatusReadFailure) {
  FailingStore failing(store_);
  failing.fail_scan = true;
  failing.fail_query_by_tag = true;
  failing.fail_get = true;
  SchedulingService service(failing, clock_.clock(), 10);

  EXPECT_EQ(service.status(TaskRef{}, std::nullopt, false).error(),
            Error::StatusUnavailable);
  EXPECT_EQ(service.status(ref("billing"), std::nullopt, false).error(),
            Error::StatusUnavailable);
  EXPECT_EQ(service
                .status(ref("billing+abc@" + std::to_string(kBaseTime)),
                        std::nullopt, false)
                .error(),
            Error::StatusUnavailable);
}
