#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/page.hpp"
#include "batchforge/domain/worker.hpp"
#include "batchforge/storage/database_service.hpp"
#include "batchforge/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>

namespace batchforge {

// Tracks worker capacity and health and answers "which worker can take a task
// now". Capacity moves in two steps: reserve_capacity takes a unit and marks
// it unbound, bind_reservation hands it to a task. Both the count and the
// unbound reservations are guarded by one mutex per worker.
class WorkerRegistry {
public:
  explicit WorkerRegistry(storage::DatabaseService &db);

  WorkerRegistry(const WorkerRegistry &) = delete;
  auto operator=(const WorkerRegistry &) -> WorkerRegistry & = delete;

  [[nodiscard]] auto load_from_database() -> Result<void>;

  [[nodiscard]] auto register_worker(const WorkerSpec &spec)
      -> Result<WorkerId>;
  [[nodiscard]] auto heartbeat(const WorkerId &id,
                               std::chrono::system_clock::time_point at)
      -> Result<void>;

  // false (and nothing changed) when the worker cannot take another task.
  [[nodiscard]] auto reserve_capacity(const WorkerId &id) -> Result<bool>;
  [[nodiscard]] auto bind_reservation(const WorkerId &id) -> Result<void>;
  [[nodiscard]] auto abandon_reservation(const WorkerId &id) -> Result<void>;
  [[nodiscard]] auto has_reservation(const WorkerId &id) const -> bool;

  [[nodiscard]] auto
  release_capacity(const WorkerId &id, TaskOutcome outcome,
                   std::optional<std::chrono::milliseconds> duration = {})
      -> Result<void>;

  // Empty pool means every registered worker.
  [[nodiscard]] auto select_candidate(std::span<const WorkerId> pool = {}) const
      -> std::optional<WorkerId>;

  [[nodiscard]] auto update_worker(const WorkerId &id,
                                   const WorkerUpdate &update)
      -> Result<Worker>;

  // Workers that missed their heartbeat window go Offline. Their tasks are
  // left alone.
  [[nodiscard]] auto
  mark_stale_offline(std::chrono::system_clock::time_point now,
                     std::chrono::seconds timeout) -> std::size_t;

  [[nodiscard]] auto get_worker(const WorkerId &id) const -> Result<Worker>;
  [[nodiscard]] auto list_workers(const WorkerFilter &filter = {}) const
      -> Page<Worker>;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  struct Slot {
    mutable std::mutex mu;
    Worker worker;
    int unbound{0};
  };
  using SlotPtr = std::shared_ptr<Slot>;

  [[nodiscard]] auto find_slot(const WorkerId &id) const -> SlotPtr;
  [[nodiscard]] auto snapshot_slots() const -> std::vector<SlotPtr>;
  // Caller holds slot.mu. Publishes `next` only once it is persisted.
  [[nodiscard]] auto commit(Slot &slot, Worker next) -> Result<void>;

  storage::DatabaseService &db_;
  mutable std::shared_mutex mu_;
  ankerl::unordered_dense::map<WorkerId, SlotPtr> workers_;
};

} // namespace batchforge
