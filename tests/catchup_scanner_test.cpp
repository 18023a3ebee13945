#include "tickback/scheduler/catchup_scanner.hpp"
#include "tickback/storage/memory_task_store.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <vector>

using namespace tickback;
using tickback::test::FailingStore;
using tickback::test::kBaseTime;
using tickback::test::ManualClock;

class CatchupScannerTest : public ::testing::Test {
protected:
  auto recorder() -> DispatchFn {
    return [this](Task task) {
      std::lock_guard lock(mu_);
      dispatched_.push_back(std::move(task));
      return true;
    };
  }

  auto add(std::int64_t trigger_at, std::string tag, std::string uid,
           TaskState state = TaskState::Pending) -> void {
    Task task;
    task.trigger_at = trigger_at;
    task.tag = std::move(tag);
    task.unique_id = std::move(uid);
    task.callback = "http://127.0.0.1/";
    task.state = state;
    ASSERT_TRUE(store_.put(to_row(task)).has_value());
  }

  auto dispatched_ids() -> std::set<std::string> {
    std::lock_guard lock(mu_);
    std::set<std::string> ids;
    for (const auto& task : dispatched_) {
      ids.insert(task.id());
    }
    return ids;
  }

  MemoryTaskStore store_;
  ManualClock clock_{kBaseTime + 30};
  std::mutex mu_;
  std::vector<Task> dispatched_;
};

TEST_F(CatchupScannerTest, ReplaysOnlyOverduePendingTasks) {
  add(kBaseTime - 600, "a", "1");
  add(kBaseTime - 60, "b", "2");
  add(kBaseTime, "c", "3");
  add(kBaseTime + 60, "future", "4");
  add(kBaseTime - 120, "done", "5", TaskState::Successful);
  add(kBaseTime - 120, "failed", "6", TaskState::Failed);
  CatchupScanner scanner(store_, recorder(), clock_.clock(), 100);

  auto report = scanner.run();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->up_to, kBaseTime);
  EXPECT_EQ(report->scanned, 3u);
  EXPECT_EQ(report->dispatched, 3u);
  EXPECT_EQ(dispatched_ids(),
            (std::set<std::string>{"a+1@" + std::to_string(kBaseTime - 600),
                                   "b+2@" + std::to_string(kBaseTime - 60),
                                   "c+3@" + std::to_string(kBaseTime)}));
}

TEST_F(CatchupScannerTest, WalksEveryPage) {
  for (int i = 0; i < 25; ++i) {
    add(kBaseTime - 60 * (i % 5), "t", std::format("{:02x}", i));
  }
  CatchupScanner scanner(store_, recorder(), clock_.clock(), 10);

  auto report = scanner.run();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->pages, 3u);
  EXPECT_EQ(report->dispatched, 25u);
  EXPECT_EQ(dispatched_ids().size(), 25u);
}

TEST_F(CatchupScannerTest, ScanFailureAborts) {
  add(kBaseTime - 60, "a", "1");
  FailingStore failing(store_);
  failing.fail_scan = true;
  CatchupScanner scanner(failing, recorder(), clock_.clock(), 10);

  auto report = scanner.run();

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), Error::LookupFailed);
  EXPECT_FALSE(scanner.is_running());
}

TEST_F(CatchupScannerTest, ConcurrentRunIsBusy) {
  add(kBaseTime - 60, "a", "1");
  std::promise<void> entered;
  std::promise<void> release;
  auto gate = release.get_future().share();
  std::atomic<bool> first{true};

  CatchupScanner scanner(
      store_,
      [&](Task) {
        if (first.exchange(false)) {
          entered.set_value();
          gate.wait();
        }
        return true;
      },
      clock_.clock(), 10);

  scanner.run_async();
  entered.get_future().wait();
  EXPECT_TRUE(scanner.is_running());

  auto second = scanner.run();
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), Error::Busy);

  release.set_value();
  scanner.join();
  EXPECT_FALSE(scanner.is_running());

  EXPECT_TRUE(scanner.run().has_value());
}
