#pragma once

#include "batchforge/config/config.hpp"
#include "batchforge/core/coroutine.hpp"
#include "batchforge/core/error.hpp"
#include "batchforge/scheduler/dispatcher.hpp"
#include "batchforge/scheduler/scheduler.hpp"
#include "batchforge/storage/database_service.hpp"
#include "batchforge/store/history_recorder.hpp"
#include "batchforge/store/job_store.hpp"
#include "batchforge/store/task_store.hpp"
#include "batchforge/worker/worker_registry.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace batchforge {

// Wires storage, stores, scheduler and dispatcher together and owns the
// io_context threads that run deferred dispatch and the periodic sweep.
class Application {
public:
  // A null dispatcher selects the in-process LocalDispatcher.
  explicit Application(Config config = {},
                       std::unique_ptr<Dispatcher> dispatcher = nullptr,
                       std::unique_ptr<storage::DatabaseService> db = nullptr);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const Config & {
    return config_;
  }

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Service access
  [[nodiscard]] auto scheduler() noexcept -> Scheduler & { return scheduler_; }
  [[nodiscard]] auto jobs() noexcept -> JobStore & { return jobs_; }
  [[nodiscard]] auto tasks() noexcept -> TaskStore & { return tasks_; }
  [[nodiscard]] auto workers() noexcept -> WorkerRegistry & {
    return workers_;
  }
  [[nodiscard]] auto history() noexcept -> HistoryRecorder & {
    return history_;
  }
  [[nodiscard]] auto dispatcher() noexcept -> Dispatcher & {
    return *dispatcher_;
  }
  [[nodiscard]] auto database() noexcept -> storage::DatabaseService & {
    return *db_;
  }

private:
  [[nodiscard]] auto load_state() -> Result<void>;
  auto run_sweep_loop(std::shared_ptr<boost::asio::steady_timer> timer)
      -> spawn_task;

  Config config_;
  std::atomic<bool> running_{false};

  boost::asio::io_context io_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_;
  std::vector<std::jthread> io_threads_;
  std::shared_ptr<boost::asio::steady_timer> sweep_timer_;

  std::unique_ptr<storage::DatabaseService> db_;
  HistoryRecorder history_;
  WorkerRegistry workers_;
  TaskStore tasks_;
  JobStore jobs_;
  std::unique_ptr<Dispatcher> dispatcher_;
  Scheduler scheduler_;
};

} // namespace batchforge
