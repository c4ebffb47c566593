#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/job.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/util/json.hpp"

#include <vector>

namespace batchforge {

// Callbacks the worker-side runtime invokes once it has accepted a task.
class CompletionHandler {
public:
  virtual ~CompletionHandler() = default;

  virtual auto on_task_started(const TaskId &task) -> Result<void> = 0;
  virtual auto on_task_completed(const TaskId &task, JsonValue result)
      -> Result<void> = 0;
  virtual auto on_task_failed(const TaskId &task, JsonValue error)
      -> Result<void> = 0;
};

// Hands a task to a worker process. The transport (queue, RPC, in-process
// pool) lives behind this interface. An error leaves the task Pending.
class Dispatcher {
public:
  virtual ~Dispatcher() = default;

  [[nodiscard]] virtual auto dispatch(const WorkerId &worker,
                                      const TaskId &task,
                                      const JsonValue &parameters)
      -> Result<void> = 0;

  // Transports that report back in-process are told where to report.
  virtual auto attach(CompletionHandler & /*handler*/) -> void {}
  // Stops accepting work and waits for tasks already handed over.
  virtual auto shutdown() -> void {}
};

// Expands a job submitted without an explicit task list.
class TaskPlanner {
public:
  virtual ~TaskPlanner() = default;

  [[nodiscard]] virtual auto plan(const Job &job)
      -> Result<std::vector<TaskSpec>> = 0;
};

} // namespace batchforge
