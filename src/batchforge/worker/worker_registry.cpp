#include "batchforge/worker/worker_registry.hpp"

#include "batchforge/util/log.hpp"
#include "batchforge/util/time.hpp"

#include <algorithm>
#include <ranges>
#include <tuple>
#include <vector>

namespace batchforge {

namespace {

[[nodiscard]] auto now() -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::now();
}

// Idle and Busy track the task count; other statuses are operator or health
// states that the count does not override.
auto settle_load_status(Worker &w) -> void {
  if (w.status == WorkerStatus::Idle || w.status == WorkerStatus::Busy) {
    w.status = w.current_task_count > 0 ? WorkerStatus::Busy
                                        : WorkerStatus::Idle;
  }
}

auto record_outcome(Worker &w, TaskOutcome outcome,
                    std::optional<std::chrono::milliseconds> duration) -> void {
  if (outcome != TaskOutcome::Completed && outcome != TaskOutcome::Failed) {
    return;
  }
  ++w.total_tasks_processed;
  if (outcome == TaskOutcome::Failed) {
    ++w.failed_task_count;
  }
  if (!duration) {
    return;
  }
  // Running mean over processed tasks.
  const auto n = w.total_tasks_processed;
  const auto prev = w.average_task_duration.value_or(*duration);
  w.average_task_duration = prev + (*duration - prev) / n;
}

} // namespace

WorkerRegistry::WorkerRegistry(storage::DatabaseService &db) : db_(db) {}

auto WorkerRegistry::load_from_database() -> Result<void> {
  auto rows = db_.load_workers();
  if (!rows) {
    log::error("Failed to load workers: {}", rows.error().message());
    return fail(rows.error());
  }
  std::unique_lock lock(mu_);
  workers_.clear();
  for (auto &w : *rows) {
    auto slot = std::make_shared<Slot>();
    auto id = w.id;
    slot->worker = std::move(w);
    workers_.emplace(std::move(id), std::move(slot));
  }
  log::info("Loaded {} workers", workers_.size());
  return ok();
}

auto WorkerRegistry::find_slot(const WorkerId &id) const -> SlotPtr {
  std::shared_lock lock(mu_);
  auto it = workers_.find(id);
  return it != workers_.end() ? it->second : nullptr;
}

auto WorkerRegistry::snapshot_slots() const -> std::vector<SlotPtr> {
  std::shared_lock lock(mu_);
  std::vector<SlotPtr> out;
  out.reserve(workers_.size());
  for (const auto &[_, slot] : workers_) {
    out.push_back(slot);
  }
  return out;
}

auto WorkerRegistry::commit(Slot &slot, Worker next) -> Result<void> {
  next.updated_at = now();
  auto version = db_.save_worker(next);
  if (!version) {
    log::error("Failed to persist worker {}: {}", next.id,
               version.error().message());
    return fail(version.error());
  }
  next.version = *version;
  slot.worker = std::move(next);
  return ok();
}

auto WorkerRegistry::register_worker(const WorkerSpec &spec)
    -> Result<WorkerId> {
  if (auto valid = validate_worker_spec(spec); !valid) {
    return fail(valid.error());
  }
  const auto ts = now();
  Worker w{
      .id = generate_worker_id(),
      .name = spec.name,
      .host = spec.host,
      .max_concurrent_tasks = spec.max_concurrent_tasks,
      .current_task_count = 0,
      .status = WorkerStatus::Idle,
      .is_active = spec.is_active,
      .last_heartbeat = ts,
      .registered_at = ts,
  };

  auto slot = std::make_shared<Slot>();
  std::scoped_lock slot_lock(slot->mu);
  if (auto r = commit(*slot, std::move(w)); !r) {
    return fail(r.error());
  }
  auto id = slot->worker.id;
  {
    std::unique_lock lock(mu_);
    workers_.emplace(id, slot);
  }
  log::info("Registered worker {} ({}@{}, capacity {})", id, spec.name,
            spec.host, spec.max_concurrent_tasks);
  return ok(std::move(id));
}

auto WorkerRegistry::heartbeat(const WorkerId &id,
                               std::chrono::system_clock::time_point at)
    -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  auto next = slot->worker;
  next.last_heartbeat = std::max(next.last_heartbeat, at);
  if (next.status == WorkerStatus::Offline && next.is_active) {
    next.status = next.current_task_count > 0 ? WorkerStatus::Busy
                                              : WorkerStatus::Idle;
    log::info("Worker {} back online", id);
  }
  return commit(*slot, std::move(next));
}

auto WorkerRegistry::reserve_capacity(const WorkerId &id) -> Result<bool> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (!accepts_work(slot->worker)) {
    return ok(false);
  }
  auto next = slot->worker;
  ++next.current_task_count;
  next.status = WorkerStatus::Busy;
  if (auto r = commit(*slot, std::move(next)); !r) {
    return fail(r.error());
  }
  ++slot->unbound;
  return ok(true);
}

auto WorkerRegistry::bind_reservation(const WorkerId &id) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (slot->unbound <= 0) {
    return fail(Error::CapacityUnavailable);
  }
  --slot->unbound;
  return ok();
}

auto WorkerRegistry::has_reservation(const WorkerId &id) const -> bool {
  auto slot = find_slot(id);
  if (!slot) {
    return false;
  }
  std::scoped_lock lock(slot->mu);
  return slot->unbound > 0;
}

auto WorkerRegistry::abandon_reservation(const WorkerId &id) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (slot->unbound <= 0) {
    return fail(Error::CapacityUnavailable);
  }
  auto next = slot->worker;
  --next.current_task_count;
  settle_load_status(next);
  if (auto r = commit(*slot, std::move(next)); !r) {
    return fail(r.error());
  }
  --slot->unbound;
  log::debug("Worker {} reservation abandoned", id);
  return ok();
}

auto WorkerRegistry::release_capacity(
    const WorkerId &id, TaskOutcome outcome,
    std::optional<std::chrono::milliseconds> duration) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (slot->worker.current_task_count - slot->unbound <= 0) {
    log::warn("Worker {} released capacity it does not hold ({})", id,
              to_string_view(outcome));
    return fail(Error::CapacityUnavailable);
  }
  auto next = slot->worker;
  --next.current_task_count;
  if (next.current_task_count == 0 && next.is_active &&
      next.status == WorkerStatus::Busy) {
    next.status = WorkerStatus::Idle;
  }
  record_outcome(next, outcome, duration);
  return commit(*slot, std::move(next));
}

auto WorkerRegistry::select_candidate(std::span<const WorkerId> pool) const
    -> std::optional<WorkerId> {
  using Key = std::tuple<int, std::chrono::system_clock::time_point, WorkerId>;
  std::optional<Key> best;

  auto consider = [&](const Slot &slot) {
    std::scoped_lock lock(slot.mu);
    const auto &w = slot.worker;
    if (!accepts_work(w)) {
      return;
    }
    Key key{w.current_task_count, w.last_heartbeat, w.id};
    if (!best || key < *best) {
      best = std::move(key);
    }
  };

  if (pool.empty()) {
    for (const auto &slot : snapshot_slots()) {
      consider(*slot);
    }
  } else {
    for (const auto &id : pool) {
      if (auto slot = find_slot(id)) {
        consider(*slot);
      }
    }
  }

  if (!best) {
    return std::nullopt;
  }
  return std::get<WorkerId>(std::move(*best));
}

auto WorkerRegistry::update_worker(const WorkerId &id,
                                   const WorkerUpdate &update)
    -> Result<Worker> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  auto next = slot->worker;
  if (update.name) {
    if (update.name->empty() || update.name->size() > kMaxNameLength) {
      return fail(Error::InvalidSpec);
    }
    next.name = *update.name;
  }
  if (update.max_concurrent_tasks) {
    if (*update.max_concurrent_tasks < 1 ||
        *update.max_concurrent_tasks < next.current_task_count) {
      return fail(Error::InvalidSpec);
    }
    next.max_concurrent_tasks = *update.max_concurrent_tasks;
  }
  if (update.is_active) {
    next.is_active = *update.is_active;
  }
  if (update.status) {
    next.status = *update.status;
    settle_load_status(next);
  }
  if (auto r = commit(*slot, std::move(next)); !r) {
    return fail(r.error());
  }
  log::info("Worker {} updated: status={} active={} capacity={}", id,
            to_string_view(slot->worker.status), slot->worker.is_active,
            slot->worker.max_concurrent_tasks);
  return ok(slot->worker);
}

auto WorkerRegistry::mark_stale_offline(
    std::chrono::system_clock::time_point at, std::chrono::seconds timeout)
    -> std::size_t {
  std::size_t marked = 0;
  for (const auto &slot : snapshot_slots()) {
    std::scoped_lock lock(slot->mu);
    const auto &w = slot->worker;
    if (w.status != WorkerStatus::Idle && w.status != WorkerStatus::Busy) {
      continue;
    }
    if (at - w.last_heartbeat <= timeout) {
      continue;
    }
    auto next = w;
    next.status = WorkerStatus::Offline;
    if (auto r = commit(*slot, std::move(next)); !r) {
      continue;
    }
    log::warn("Worker {} missed heartbeats since {}, marked offline", w.id,
              util::format_iso8601(w.last_heartbeat));
    ++marked;
  }
  return marked;
}

auto WorkerRegistry::get_worker(const WorkerId &id) const -> Result<Worker> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  return ok(slot->worker);
}

auto WorkerRegistry::list_workers(const WorkerFilter &filter) const
    -> Page<Worker> {
  std::vector<Worker> rows;
  for (const auto &slot : snapshot_slots()) {
    std::scoped_lock lock(slot->mu);
    const auto &w = slot->worker;
    if (filter.status && w.status != *filter.status) {
      continue;
    }
    if (filter.is_active && w.is_active != *filter.is_active) {
      continue;
    }
    rows.push_back(w);
  }
  std::ranges::sort(rows, [](const Worker &a, const Worker &b) {
    return std::tie(a.name, a.id) < std::tie(b.name, b.id);
  });
  return paginate(std::move(rows), filter.offset, filter.limit);
}

auto WorkerRegistry::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return workers_.size();
}

} // namespace batchforge
