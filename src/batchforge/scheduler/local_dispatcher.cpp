#include "batchforge/scheduler/local_dispatcher.hpp"

#include "batchforge/core/coroutine.hpp"
#include "batchforge/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <string>

namespace batchforge {

LocalDispatcher::LocalDispatcher(LocalDispatcherOptions options)
    : options_(options), pool_(options.threads == 0 ? 1 : options.threads),
      rng_(options.seed) {}

LocalDispatcher::~LocalDispatcher() { shutdown(); }

auto LocalDispatcher::attach(CompletionHandler &handler) -> void {
  handler_.store(&handler, std::memory_order_release);
}

auto LocalDispatcher::shutdown() -> void {
  if (!accepting_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  pool_.join();
}

auto LocalDispatcher::draw_plan() -> std::optional<Plan> {
  std::scoped_lock lock(rng_mu_);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  if (unit(rng_) < options_.reject_rate) {
    return std::nullopt;
  }
  const auto lo = options_.min_duration.count();
  const auto hi = std::max(lo, options_.max_duration.count());
  std::uniform_int_distribution<std::int64_t> span(lo, hi);
  std::uniform_int_distribution<std::int64_t> startup(0, lo);
  return Plan{
      .startup = std::chrono::milliseconds(startup(rng_)),
      .duration = std::chrono::milliseconds(span(rng_)),
      .fails = unit(rng_) < options_.fail_rate,
  };
}

auto LocalDispatcher::dispatch(const WorkerId &worker, const TaskId &task,
                               const JsonValue & /*parameters*/)
    -> Result<void> {
  if (!accepting_.load(std::memory_order_acquire) ||
      handler_.load(std::memory_order_acquire) == nullptr) {
    return fail(Error::SystemNotRunning);
  }
  auto plan = draw_plan();
  if (!plan) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    return fail(Error::DispatchFailed);
  }
  dispatched_.fetch_add(1, std::memory_order_relaxed);
  in_flight_.fetch_add(1, std::memory_order_acq_rel);
  boost::asio::co_spawn(pool_, run_task(worker, task, *plan),
                        boost::asio::detached);
  return ok();
}

auto LocalDispatcher::run_task(WorkerId worker, TaskId task, Plan plan)
    -> spawn_task {
  auto *handler = handler_.load(std::memory_order_acquire);

  if (!co_await async_sleep(plan.startup)) {
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    co_return;
  }
  if (auto r = handler->on_task_started(task); !r) {
    // Cancelled or reset before it could start.
    log::debug("Worker {}: task {} not started: {}", worker, task,
               r.error().message());
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    co_return;
  }

  if (!co_await async_sleep(plan.duration)) {
    log::debug("Worker {}: task {} interrupted before reporting", worker,
               task);
    in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    co_return;
  }

  Result<void> reported;
  if (plan.fails) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    reported = handler->on_task_failed(
        task, error_payload(std::format("simulated failure on {}", worker)));
  } else {
    JsonValue result{};
    result["worker"] = worker.str();
    result["duration_ms"] = static_cast<std::int64_t>(plan.duration.count());
    reported = handler->on_task_completed(task, std::move(result));
  }
  if (!reported) {
    log::debug("Worker {}: outcome of task {} not recorded: {}", worker, task,
               reported.error().message());
  }
  in_flight_.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace batchforge
