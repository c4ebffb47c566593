#pragma once

#include "batchforge/core/coroutine.hpp"
#include "batchforge/scheduler/dispatcher.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace batchforge {

struct LocalDispatcherOptions {
  std::size_t threads{4};
  std::chrono::milliseconds min_duration{5};
  std::chrono::milliseconds max_duration{25};
  double fail_rate{0.0};
  double reject_rate{0.0};
  std::uint64_t seed{42};
};

// Runs dispatched tasks as timers on an in-process thread pool and reports
// start/completion back through the attached CompletionHandler. Outcomes are
// drawn from a seeded generator, so a run is reproducible up to thread
// interleaving.
class LocalDispatcher final : public Dispatcher {
public:
  explicit LocalDispatcher(LocalDispatcherOptions options = {});
  ~LocalDispatcher() override;

  LocalDispatcher(const LocalDispatcher &) = delete;
  auto operator=(const LocalDispatcher &) -> LocalDispatcher & = delete;

  [[nodiscard]] auto dispatch(const WorkerId &worker, const TaskId &task,
                              const JsonValue &parameters)
      -> Result<void> override;
  auto attach(CompletionHandler &handler) -> void override;

  auto shutdown() -> void override;

  [[nodiscard]] auto dispatched() const noexcept -> std::uint64_t {
    return dispatched_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto rejected() const noexcept -> std::uint64_t {
    return rejected_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto failed() const noexcept -> std::uint64_t {
    return failed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto in_flight() const noexcept -> std::uint64_t {
    return in_flight_.load(std::memory_order_acquire);
  }

private:
  struct Plan {
    std::chrono::milliseconds startup;
    std::chrono::milliseconds duration;
    bool fails;
  };

  [[nodiscard]] auto draw_plan() -> std::optional<Plan>;
  auto run_task(WorkerId worker, TaskId task, Plan plan)
      -> spawn_task;

  LocalDispatcherOptions options_;
  boost::asio::thread_pool pool_;
  std::atomic<CompletionHandler *> handler_{nullptr};
  std::atomic<bool> accepting_{true};

  std::mutex rng_mu_;
  std::mt19937_64 rng_;

  std::atomic<std::uint64_t> dispatched_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> in_flight_{0};
};

} // namespace batchforge
