#include "batchforge/storage/memory_database.hpp"

#include "batchforge/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace batchforge::storage {

namespace {

template <typename Map>
[[nodiscard]] auto values_of(const Map &map)
    -> std::vector<typename Map::mapped_type> {
  std::vector<typename Map::mapped_type> out;
  out.reserve(map.size());
  for (const auto &[_, value] : map) {
    out.push_back(value);
  }
  return out;
}

template <typename Map, typename Key>
[[nodiscard]] auto find_copy(const Map &map, const Key &key)
    -> Result<typename Map::mapped_type> {
  auto it = map.find(key);
  if (it == map.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

} // namespace

auto MemoryDatabase::open() -> Result<void> {
  std::scoped_lock lock(mu_);
  open_ = true;
  return ok();
}

auto MemoryDatabase::close() -> void {
  std::scoped_lock lock(mu_);
  open_ = false;
}

auto MemoryDatabase::is_open() const noexcept -> bool {
  std::scoped_lock lock(mu_);
  return open_;
}

auto MemoryDatabase::inject_write_failures(std::size_t count,
                                           std::error_code ec) -> void {
  std::scoped_lock lock(mu_);
  injected_failures_ = count;
  injected_error_ = ec;
}

auto MemoryDatabase::take_injected_failure() -> std::error_code {
  if (injected_failures_ == 0) {
    return {};
  }
  --injected_failures_;
  return injected_error_;
}

template <typename Map, typename Entity>
auto MemoryDatabase::save_versioned(Map &map, const Entity &entity)
    -> Result<std::uint64_t> {
  if (!open_) {
    return fail(Error::SystemNotRunning);
  }
  if (auto ec = take_injected_failure(); ec) {
    return fail(ec);
  }
  auto it = map.find(entity.id);
  if (it == map.end()) {
    if (entity.version != 0) {
      return fail(Error::VersionConflict);
    }
  } else if (entity.version == 0) {
    return fail(Error::AlreadyExists);
  } else if (it->second.version != entity.version) {
    log::warn("Version conflict on {}: stored {} expected {}", entity.id,
              it->second.version, entity.version);
    return fail(Error::VersionConflict);
  }
  return ok(entity.version + 1);
}

auto MemoryDatabase::save_job(const Job &job, const JobHistoryEntry *history)
    -> Result<std::uint64_t> {
  std::scoped_lock lock(mu_);
  auto version = save_versioned(jobs_, job);
  if (!version) {
    return version;
  }
  auto &stored = jobs_[job.id];
  stored = job;
  stored.version = *version;
  if (history) {
    job_history_[job.id].push_back(*history);
    last_sequence_ = std::max(last_sequence_, history->sequence);
  }
  writes_.fetch_add(1, std::memory_order_relaxed);
  return version;
}

auto MemoryDatabase::load_job(const JobId &id) const -> Result<Job> {
  std::scoped_lock lock(mu_);
  return find_copy(jobs_, id);
}

auto MemoryDatabase::load_jobs() const -> Result<std::vector<Job>> {
  std::scoped_lock lock(mu_);
  return ok(values_of(jobs_));
}

auto MemoryDatabase::save_task(const Task &task, const TaskHistoryEntry *history)
    -> Result<std::uint64_t> {
  std::scoped_lock lock(mu_);
  auto version = save_versioned(tasks_, task);
  if (!version) {
    return version;
  }
  auto &stored = tasks_[task.id];
  stored = task;
  stored.version = *version;
  if (history) {
    task_history_[task.id].push_back(*history);
    last_sequence_ = std::max(last_sequence_, history->sequence);
  }
  writes_.fetch_add(1, std::memory_order_relaxed);
  return version;
}

auto MemoryDatabase::load_task(const TaskId &id) const -> Result<Task> {
  std::scoped_lock lock(mu_);
  return find_copy(tasks_, id);
}

auto MemoryDatabase::load_tasks() const -> Result<std::vector<Task>> {
  std::scoped_lock lock(mu_);
  return ok(values_of(tasks_));
}

auto MemoryDatabase::save_worker(const Worker &worker)
    -> Result<std::uint64_t> {
  std::scoped_lock lock(mu_);
  auto version = save_versioned(workers_, worker);
  if (!version) {
    return version;
  }
  auto &stored = workers_[worker.id];
  stored = worker;
  stored.version = *version;
  writes_.fetch_add(1, std::memory_order_relaxed);
  return version;
}

auto MemoryDatabase::load_worker(const WorkerId &id) const -> Result<Worker> {
  std::scoped_lock lock(mu_);
  return find_copy(workers_, id);
}

auto MemoryDatabase::load_workers() const -> Result<std::vector<Worker>> {
  std::scoped_lock lock(mu_);
  return ok(values_of(workers_));
}

auto MemoryDatabase::load_job_history(const JobId &id) const
    -> Result<std::vector<JobHistoryEntry>> {
  std::scoped_lock lock(mu_);
  auto it = job_history_.find(id);
  if (it == job_history_.end()) {
    return ok(std::vector<JobHistoryEntry>{});
  }
  auto rows = it->second;
  std::ranges::sort(rows, {}, &JobHistoryEntry::sequence);
  return ok(std::move(rows));
}

auto MemoryDatabase::load_task_history(const TaskId &id) const
    -> Result<std::vector<TaskHistoryEntry>> {
  std::scoped_lock lock(mu_);
  auto it = task_history_.find(id);
  if (it == task_history_.end()) {
    return ok(std::vector<TaskHistoryEntry>{});
  }
  auto rows = it->second;
  std::ranges::sort(rows, {}, &TaskHistoryEntry::sequence);
  return ok(std::move(rows));
}

auto MemoryDatabase::last_history_sequence() const -> Result<std::uint64_t> {
  std::scoped_lock lock(mu_);
  return ok(last_sequence_);
}

} // namespace batchforge::storage
