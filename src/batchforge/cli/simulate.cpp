#include "batchforge/app/application.hpp"
#include "batchforge/cli/commands.hpp"
#include "batchforge/cli/formatting.hpp"
#include "batchforge/config/config.hpp"
#include "batchforge/scheduler/local_dispatcher.hpp"
#include "batchforge/util/json.hpp"
#include "batchforge/util/log.hpp"
#include "batchforge/util/time.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <print>
#include <thread>
#include <vector>

namespace batchforge::cli {

namespace {

constexpr std::array kJobTypes = {JobType::Billing, JobType::Inventory,
                                  JobType::Report, JobType::DataProcessing};
constexpr std::array kPriorities = {JobPriority::Normal, JobPriority::High,
                                    JobPriority::Low, JobPriority::Urgent};

const TenantId kTenant{"simulation"};
const UserId kOperator{"simulator"};

struct JobOutcome {
  JobId id;
  std::string name;
  JobStatus status{JobStatus::Pending};
  int progress{0};
  int retries{0};
  bool settled{false};
};

struct Summary {
  std::vector<JobOutcome> jobs;
  std::vector<Worker> workers;
  std::uint64_t dispatched{0};
  std::uint64_t rejected{0};
  std::uint64_t failed{0};
  std::uint64_t history_rows{0};
  std::chrono::milliseconds elapsed{0};
  bool timed_out{false};
};

auto count_status(const Summary &summary, JobStatus status) -> std::int64_t {
  return std::ranges::count_if(summary.jobs, [status](const JobOutcome &j) {
    return j.status == status;
  });
}

auto total_retries(const Summary &summary) -> std::int64_t {
  std::int64_t total = 0;
  for (const auto &j : summary.jobs) {
    total += j.retries;
  }
  return total;
}

auto make_tasks(int count, int max_retries) -> std::vector<TaskSpec> {
  std::vector<TaskSpec> tasks;
  tasks.reserve(static_cast<std::size_t>(count));
  for (int k = 1; k <= count; ++k) {
    JsonValue params{};
    params["step"] = static_cast<std::int64_t>(k);
    tasks.push_back(TaskSpec{
        .name = std::format("step-{}", k),
        .sequence_number = k,
        .parameters = std::move(params),
        .max_retries = max_retries,
    });
  }
  return tasks;
}

// Retries a job once all of its tasks have settled with at least one
// failure; a job out of retries is cancelled.
auto settle_failed_job(Application &app, JobOutcome &outcome) -> void {
  const auto counts = app.tasks().counts_for_job(outcome.id);
  if (counts.failed == 0 || counts.pending > 0 || counts.in_flight() > 0) {
    return;
  }
  auto retried = app.scheduler().retry_job(kTenant, outcome.id, kOperator);
  if (retried) {
    return;
  }
  if (retried.error() != Error::RetryExhausted) {
    log::warn("Simulation: retry of job {} failed: {}", outcome.id,
              retried.error().message());
    return;
  }
  if (auto c = app.scheduler().cancel_job(kTenant, outcome.id, kOperator);
      !c) {
    log::warn("Simulation: cancel of job {} failed: {}", outcome.id,
              c.error().message());
  }
}

auto drive(Application &app, std::vector<JobOutcome> &jobs,
           std::chrono::seconds timeout) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    bool all_settled = true;
    for (auto &outcome : jobs) {
      if (outcome.settled) {
        continue;
      }
      auto job = app.jobs().get_job(kTenant, outcome.id);
      if (!job) {
        log::error("Simulation: job {} vanished: {}", outcome.id,
                   job.error().message());
        outcome.settled = true;
        continue;
      }
      if (job->status == JobStatus::Completed ||
          job->status == JobStatus::Cancelled) {
        outcome.settled = true;
        continue;
      }
      all_settled = false;
      settle_failed_job(app, outcome);
    }
    if (all_settled) {
      return true;
    }
    // Picks up tasks left Pending by rejected dispatches.
    (void)app.scheduler().sweep(std::chrono::system_clock::now());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return false;
}

auto print_json(const Summary &summary) -> void {
  JsonValue jobs = std::vector<JsonValue>{};
  for (const auto &j : summary.jobs) {
    jobs.get_array().emplace_back(JsonValue{
        {"id", j.id.str()},
        {"name", j.name},
        {"status", std::string(to_string_view(j.status))},
        {"progress_percent", static_cast<std::int64_t>(j.progress)},
        {"retry_count", static_cast<std::int64_t>(j.retries)},
    });
  }
  JsonValue workers = std::vector<JsonValue>{};
  for (const auto &w : summary.workers) {
    JsonValue obj{
        {"id", w.id.str()},
        {"name", w.name},
        {"status", std::string(to_string_view(w.status))},
        {"total_tasks_processed", w.total_tasks_processed},
        {"failed_task_count", w.failed_task_count},
        {"current_task_count", static_cast<std::int64_t>(w.current_task_count)},
    };
    if (w.average_task_duration) {
      obj.get_object().emplace(
          "average_task_duration_ms",
          static_cast<std::int64_t>(w.average_task_duration->count()));
    }
    workers.get_array().emplace_back(std::move(obj));
  }
  JsonValue output{
      {"jobs", std::move(jobs)},
      {"workers", std::move(workers)},
      {"summary",
       JsonValue{
           {"completed", count_status(summary, JobStatus::Completed)},
           {"cancelled", count_status(summary, JobStatus::Cancelled)},
           {"total", static_cast<std::int64_t>(summary.jobs.size())},
           {"retries", total_retries(summary)},
           {"dispatched", static_cast<std::int64_t>(summary.dispatched)},
           {"rejected", static_cast<std::int64_t>(summary.rejected)},
           {"task_failures", static_cast<std::int64_t>(summary.failed)},
           {"history_rows", static_cast<std::int64_t>(summary.history_rows)},
           {"elapsed_ms", static_cast<std::int64_t>(summary.elapsed.count())},
           {"timed_out", summary.timed_out},
       }},
  };
  std::println("{}", dump_json(output));
}

auto print_text(const Summary &summary) -> void {
  std::println("{}", fmt::paint("Jobs", fmt::Tone::Bold));
  fmt::Table jobs_table(
      {{"NAME"}, {"STATUS"}, {"PROGRESS"}, {"RETRIES", true}});
  for (const auto &j : summary.jobs) {
    jobs_table.add_row({j.name, fmt::status_cell(j.status),
                        fmt::progress_bar(j.progress),
                        std::format("{}", j.retries)});
  }
  jobs_table.print();

  std::println("\n{}", fmt::paint("Workers", fmt::Tone::Bold));
  fmt::Table workers_table({{"NAME"},
                            {"STATUS"},
                            {"PROCESSED", true},
                            {"FAILED", true},
                            {"AVG", true}});
  for (const auto &w : summary.workers) {
    workers_table.add_row(
        {w.name, fmt::status_cell(w.status),
         std::format("{}", w.total_tasks_processed),
         std::format("{}", w.failed_task_count),
         w.average_task_duration
             ? util::format_duration(*w.average_task_duration)
             : std::string("-")});
  }
  workers_table.print();

  const auto completed = count_status(summary, JobStatus::Completed);
  const auto cancelled = count_status(summary, JobStatus::Cancelled);
  std::println("\nSummary: {} completed, {} cancelled out of {} jobs; {} "
               "retries, {} dispatches ({} rejected), {} history rows in {}",
               fmt::paint(std::format("{}", completed), fmt::Tone::Green),
               fmt::paint(std::format("{}", cancelled),
                          cancelled > 0 ? fmt::Tone::Red : fmt::Tone::Plain),
               summary.jobs.size(), total_retries(summary), summary.dispatched,
               summary.rejected, summary.history_rows,
               util::format_duration(summary.elapsed));
  if (summary.timed_out) {
    std::println("{}", fmt::paint("Timed out before every job settled",
                                  fmt::Tone::Yellow));
  }
}

} // namespace

auto cmd_simulate(const SimulateOptions &opts) -> int {
  if (opts.workers < 1 || opts.jobs < 1 || opts.tasks < 0 ||
      opts.timeout_sec < 1 || (opts.capacity && *opts.capacity < 1)) {
    std::println(stderr, "Error: workers, jobs, capacity and timeout must be "
                         "positive and tasks non-negative");
    return 1;
  }

  Config config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: {}: {}", opts.config_file,
                   loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  } else {
    config.scheduler.log_level = "warn";
  }
  if (opts.log_level) {
    config.scheduler.log_level = *opts.log_level;
  }

  auto dispatcher = std::make_unique<LocalDispatcher>(LocalDispatcherOptions{
      .threads = static_cast<std::size_t>(std::clamp(opts.workers, 1, 16)),
      .fail_rate = opts.fail_rate,
      .reject_rate = opts.reject_rate,
      .seed = opts.seed,
  });
  auto *local = dispatcher.get();
  Application app(config, std::move(dispatcher));

  if (auto started = app.start(); !started) {
    std::println(stderr, "Error: failed to start: {}",
                 started.error().message());
    return 1;
  }

  const auto started_at = std::chrono::steady_clock::now();
  const int capacity =
      opts.capacity.value_or(config.workers.default_max_concurrent_tasks);
  for (int i = 0; i < opts.workers; ++i) {
    auto id = app.workers().register_worker(WorkerSpec{
        .name = std::format("sim-worker-{}", i + 1),
        .host = config.workers.default_host,
        .max_concurrent_tasks = capacity,
    });
    if (!id) {
      std::println(stderr, "Error: worker registration failed: {}",
                   id.error().message());
      return 1;
    }
  }

  const auto tasks = make_tasks(opts.tasks, config.scheduler.default_max_retries);
  std::vector<JobOutcome> jobs;
  jobs.reserve(static_cast<std::size_t>(opts.jobs));
  for (int i = 0; i < opts.jobs; ++i) {
    const auto idx = static_cast<std::size_t>(i);
    JobSpec spec{
        .tenant_id = kTenant,
        .created_by = kOperator,
        .name = std::format("sim-job-{}", i + 1),
        .type = kJobTypes[idx % kJobTypes.size()],
        .priority = kPriorities[idx % kPriorities.size()],
        .max_retries = config.scheduler.default_max_retries,
    };
    auto id = app.scheduler().submit_job(spec, tasks);
    if (!id) {
      std::println(stderr, "Error: job submission failed: {}",
                   id.error().message());
      return 1;
    }
    jobs.push_back(JobOutcome{.id = std::move(*id), .name = spec.name});
  }

  Summary summary;
  summary.timed_out =
      !drive(app, jobs, std::chrono::seconds(opts.timeout_sec));
  summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at);

  for (auto &outcome : jobs) {
    if (auto job = app.jobs().get_job(kTenant, outcome.id)) {
      outcome.status = job->status;
      outcome.progress = job->progress_percent;
      outcome.retries = job->retry_count;
    }
  }
  summary.jobs = std::move(jobs);
  summary.workers = app.workers().list_workers().items;
  summary.dispatched = local->dispatched();
  summary.rejected = local->rejected();
  summary.failed = local->failed();
  summary.history_rows = app.history().recorded();

  app.stop();

  if (opts.json) {
    print_json(summary);
  } else {
    print_text(summary);
  }
  return summary.timed_out ? 2 : 0;
}

} // namespace batchforge::cli
