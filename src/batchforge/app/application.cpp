#include "batchforge/app/application.hpp"

#include "batchforge/scheduler/local_dispatcher.hpp"
#include "batchforge/storage/memory_database.hpp"
#include "batchforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <algorithm>
#include <chrono>

namespace batchforge {

namespace {

[[nodiscard]] auto or_memory_database(
    std::unique_ptr<storage::DatabaseService> db)
    -> std::unique_ptr<storage::DatabaseService> {
  if (db) {
    return db;
  }
  return std::make_unique<storage::MemoryDatabase>();
}

[[nodiscard]] auto or_local_dispatcher(std::unique_ptr<Dispatcher> dispatcher)
    -> std::unique_ptr<Dispatcher> {
  if (dispatcher) {
    return dispatcher;
  }
  return std::make_unique<LocalDispatcher>();
}

} // namespace

Application::Application(Config config, std::unique_ptr<Dispatcher> dispatcher,
                         std::unique_ptr<storage::DatabaseService> db)
    : config_(std::move(config)), db_(or_memory_database(std::move(db))),
      history_(*db_), workers_(*db_), tasks_(*db_, workers_, history_),
      jobs_(*db_, tasks_, history_),
      dispatcher_(or_local_dispatcher(std::move(dispatcher))),
      scheduler_(io_, jobs_, tasks_, workers_, *dispatcher_) {
  scheduler_.set_heartbeat_timeout(
      std::chrono::seconds(config_.scheduler.heartbeat_timeout_sec));
  dispatcher_->attach(scheduler_);
}

Application::~Application() {
  stop();
  // In-flight tasks report into the scheduler; drain them before it goes.
  dispatcher_->shutdown();
}

auto Application::load_state() -> Result<void> {
  return history_.load_from_database()
      .and_then([this] { return workers_.load_from_database(); })
      .and_then([this] { return tasks_.load_from_database(); })
      .and_then([this] { return jobs_.load_from_database(); });
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::set_level(config_.scheduler.log_level);
  if (!config_.scheduler.log_file.empty() &&
      !log::set_output_file(config_.scheduler.log_file)) {
    log::warn("Cannot open log file {}, logging to stdout",
              config_.scheduler.log_file);
  }
  log::start();

  if (!db_->is_open()) {
    if (auto open_res = db_->open(); !open_res) {
      running_ = false;
      return fail(open_res.error());
    }
  }
  if (auto load_res = load_state(); !load_res) {
    running_ = false;
    return fail(load_res.error());
  }

  work_.emplace(io_.get_executor());
  io_.restart();
  const auto threads = std::max(1, config_.scheduler.io_threads);
  for (int i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this] { io_.run(); });
  }

  scheduler_.start();

  sweep_timer_ = std::make_shared<boost::asio::steady_timer>(io_);
  boost::asio::co_spawn(io_, run_sweep_loop(sweep_timer_),
                        boost::asio::detached);

  log::info("BatchForge started: {} io threads, sweep every {}s, heartbeat "
            "timeout {}s",
            threads, config_.scheduler.sweep_interval_sec,
            config_.scheduler.heartbeat_timeout_sec);
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping BatchForge...");

  // Stop scheduling first so no new work is dispatched.
  scheduler_.stop();
  dispatcher_->shutdown();

  // Pending deferred timers and the sweep loop die with the io_context.
  work_.reset();
  io_.stop();
  io_threads_.clear();
  sweep_timer_.reset();

  db_->close();
  log::info("BatchForge stopped");
}

auto Application::run_sweep_loop(
    std::shared_ptr<boost::asio::steady_timer> timer) -> spawn_task {
  const auto interval =
      std::chrono::seconds(config_.scheduler.sweep_interval_sec);
  while (running_.load(std::memory_order_acquire)) {
    timer->expires_after(interval);
    auto ec = co_await await_timer(*timer);
    if (ec == boost::asio::error::operation_aborted) {
      co_return;
    }
    if (ec) {
      log::warn("Sweep timer failed: {}", ec.message());
      co_return;
    }
    scheduler_.sweep(std::chrono::system_clock::now());
  }
}

} // namespace batchforge
