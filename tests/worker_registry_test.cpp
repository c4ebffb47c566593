#include "batchforge/storage/memory_database.hpp"
#include "batchforge/worker/worker_registry.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>

using namespace batchforge;
using namespace batchforge::test;
using namespace std::chrono_literals;

class WorkerRegistryTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(db_.open().has_value()); }

  auto add(std::string_view name, int capacity = 1) -> WorkerId {
    return registry_.register_worker(make_worker_spec(name, capacity)).value();
  }

  // Reserve-and-bind, the way TaskStore::assign_task consumes capacity.
  auto take(const WorkerId &id) -> bool {
    auto reserved = registry_.reserve_capacity(id);
    if (!reserved || !*reserved) {
      return false;
    }
    return registry_.bind_reservation(id).has_value();
  }

  storage::MemoryDatabase db_;
  WorkerRegistry registry_{db_};
};

TEST_F(WorkerRegistryTest, RegisterStartsIdle) {
  auto id = add("w1", 2);
  auto w = registry_.get_worker(id).value();
  EXPECT_EQ(w.name, "w1");
  EXPECT_EQ(w.status, WorkerStatus::Idle);
  EXPECT_EQ(w.current_task_count, 0);
  EXPECT_EQ(w.max_concurrent_tasks, 2);
  EXPECT_TRUE(w.is_active);
  EXPECT_EQ(w.version, 1u);
  EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(WorkerRegistryTest, RegisterRejectsInvalidSpec) {
  auto r = registry_.register_worker(make_worker_spec("w", 0));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidSpec);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(WorkerRegistryTest, CapacityNeverExceedsMaximum) {
  auto id = add("w1", 2);
  EXPECT_TRUE(take(id));
  EXPECT_EQ(registry_.get_worker(id)->status, WorkerStatus::Busy);
  EXPECT_TRUE(take(id));

  auto third = registry_.reserve_capacity(id);
  ASSERT_TRUE(third.has_value());
  EXPECT_FALSE(*third);
  EXPECT_EQ(registry_.get_worker(id)->current_task_count, 2);
}

TEST_F(WorkerRegistryTest, ReleaseReturnsToIdleAndRecordsMetrics) {
  auto id = add("w1", 2);
  ASSERT_TRUE(take(id));
  ASSERT_TRUE(take(id));

  ASSERT_TRUE(
      registry_.release_capacity(id, TaskOutcome::Completed, 100ms).has_value());
  auto w = registry_.get_worker(id).value();
  EXPECT_EQ(w.current_task_count, 1);
  EXPECT_EQ(w.status, WorkerStatus::Busy);
  EXPECT_EQ(w.total_tasks_processed, 1);
  EXPECT_EQ(w.average_task_duration, 100ms);

  ASSERT_TRUE(
      registry_.release_capacity(id, TaskOutcome::Failed, 300ms).has_value());
  w = registry_.get_worker(id).value();
  EXPECT_EQ(w.current_task_count, 0);
  EXPECT_EQ(w.status, WorkerStatus::Idle);
  EXPECT_EQ(w.total_tasks_processed, 2);
  EXPECT_EQ(w.failed_task_count, 1);
  EXPECT_EQ(w.average_task_duration, 200ms);
}

TEST_F(WorkerRegistryTest, UnassignedReleaseDoesNotCountAsProcessed) {
  auto id = add("w1");
  ASSERT_TRUE(take(id));
  ASSERT_TRUE(registry_.release_capacity(id, TaskOutcome::Unassigned)
                  .has_value());
  auto w = registry_.get_worker(id).value();
  EXPECT_EQ(w.current_task_count, 0);
  EXPECT_EQ(w.total_tasks_processed, 0);
}

TEST_F(WorkerRegistryTest, ReleaseWithoutHeldCapacityFails) {
  auto id = add("w1");
  auto r = registry_.release_capacity(id, TaskOutcome::Completed);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::CapacityUnavailable);

  // An unbound reservation is not releasable either.
  ASSERT_TRUE(registry_.reserve_capacity(id).value());
  EXPECT_EQ(registry_.release_capacity(id, TaskOutcome::Completed).error(),
            Error::CapacityUnavailable);
  ASSERT_TRUE(registry_.abandon_reservation(id).has_value());
  EXPECT_EQ(registry_.get_worker(id)->current_task_count, 0);
  EXPECT_FALSE(registry_.has_reservation(id));
}

TEST_F(WorkerRegistryTest, SelectCandidatePrefersLeastLoaded) {
  auto a = add("a", 3);
  auto b = add("b", 3);
  ASSERT_TRUE(take(a));

  auto pick = registry_.select_candidate();
  ASSERT_TRUE(pick.has_value());
  EXPECT_EQ(*pick, b);

  ASSERT_TRUE(take(b));
  ASSERT_TRUE(take(b));
  pick = registry_.select_candidate();
  ASSERT_TRUE(pick.has_value());
  EXPECT_EQ(*pick, a);
}

TEST_F(WorkerRegistryTest, SelectCandidateTieBreaksOnOldestHeartbeat) {
  auto a = add("a");
  auto b = add("b");
  const auto now = std::chrono::system_clock::now();
  ASSERT_TRUE(registry_.heartbeat(a, now + 10s).has_value());
  ASSERT_TRUE(registry_.heartbeat(b, now + 5s).has_value());
  EXPECT_EQ(registry_.select_candidate(), b);
}

TEST_F(WorkerRegistryTest, SelectCandidateSkipsIneligibleWorkers) {
  auto full = add("full");
  auto inactive = add("inactive");
  auto maintenance = add("maintenance");
  ASSERT_TRUE(take(full));
  ASSERT_TRUE(registry_.update_worker(inactive, WorkerUpdate{.is_active = false})
                  .has_value());
  ASSERT_TRUE(registry_
                  .update_worker(maintenance,
                                 WorkerUpdate{.status = WorkerStatus::Maintenance})
                  .has_value());
  EXPECT_FALSE(registry_.select_candidate().has_value());
  EXPECT_EQ(registry_.reserve_capacity(inactive).value(), false);
}

TEST_F(WorkerRegistryTest, SelectCandidateWithinPool) {
  auto a = add("a");
  auto b = add("b");
  ASSERT_TRUE(take(b));
  std::array pool{b};
  EXPECT_FALSE(registry_.select_candidate(pool).has_value());
  std::array both{a, b};
  EXPECT_EQ(registry_.select_candidate(both), a);
}

TEST_F(WorkerRegistryTest, StaleWorkersGoOfflineAndHeartbeatRevives) {
  auto id = add("w1");
  const auto later = std::chrono::system_clock::now() + 5min;

  EXPECT_EQ(registry_.mark_stale_offline(later, 90s), 1u);
  EXPECT_EQ(registry_.get_worker(id)->status, WorkerStatus::Offline);
  EXPECT_FALSE(registry_.select_candidate().has_value());
  EXPECT_EQ(registry_.mark_stale_offline(later, 90s), 0u);

  ASSERT_TRUE(registry_.heartbeat(id, later).has_value());
  EXPECT_EQ(registry_.get_worker(id)->status, WorkerStatus::Idle);
  EXPECT_EQ(registry_.select_candidate(), id);
}

TEST_F(WorkerRegistryTest, UpdateRejectsCapacityBelowLoad) {
  auto id = add("w1", 3);
  ASSERT_TRUE(take(id));
  ASSERT_TRUE(take(id));
  auto r = registry_.update_worker(id, WorkerUpdate{.max_concurrent_tasks = 1});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidSpec);

  auto grown = registry_.update_worker(id, WorkerUpdate{.max_concurrent_tasks = 5});
  ASSERT_TRUE(grown.has_value());
  EXPECT_EQ(grown->max_concurrent_tasks, 5);
}

TEST_F(WorkerRegistryTest, ListIsSortedAndFiltered) {
  add("charlie");
  auto a = add("alpha");
  add("bravo");
  ASSERT_TRUE(registry_.update_worker(a, WorkerUpdate{.is_active = false})
                  .has_value());

  auto page = registry_.list_workers();
  ASSERT_EQ(page.items.size(), 3u);
  EXPECT_EQ(page.items[0].name, "alpha");
  EXPECT_EQ(page.items[2].name, "charlie");

  auto active = registry_.list_workers(WorkerFilter{.is_active = true});
  EXPECT_EQ(active.total, 2u);

  auto paged = registry_.list_workers(WorkerFilter{.offset = 1, .limit = 1});
  EXPECT_EQ(paged.total, 3u);
  ASSERT_EQ(paged.items.size(), 1u);
  EXPECT_EQ(paged.items[0].name, "bravo");
}

TEST_F(WorkerRegistryTest, FailedPersistLeavesWorkerUnchanged) {
  auto id = add("w1");
  db_.inject_write_failures(1, make_error_code(Error::Unknown));
  auto r = registry_.reserve_capacity(id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(registry_.get_worker(id)->current_task_count, 0);
  EXPECT_FALSE(registry_.has_reservation(id));
}

TEST_F(WorkerRegistryTest, ReloadFromDatabase) {
  auto id = add("w1", 4);
  WorkerRegistry reloaded{db_};
  ASSERT_TRUE(reloaded.load_from_database().has_value());
  EXPECT_EQ(reloaded.size(), 1u);
  EXPECT_EQ(reloaded.get_worker(id)->max_concurrent_tasks, 4);
}
