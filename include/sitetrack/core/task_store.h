#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sitetrack/core/config.h"
#include "sitetrack/core/drag.h"
#include "sitetrack/core/entities.h"

namespace sitetrack {

struct UpdateOutcome {
  std::string task_id;
  bool ok{true};
  std::string error;
};

// Persistence collaborator. Receives each committed batch in a single call and
// reports one outcome per item. Implementations should treat items for
// different tasks as independent.
class UpdateSink {
 public:
  virtual ~UpdateSink() = default;
  virtual std::vector<UpdateOutcome> apply_updates(const UpdateBatch& batch) = 0;
};

// Caller-owned in-memory copy of the task collection, used as the optimistic
// mirror during a commit.
class TaskStore {
 public:
  TaskStore() = default;
  explicit TaskStore(std::vector<Task> tasks);

  const std::vector<Task>& tasks() const { return tasks_; }
  const Task* find(const std::string& id) const;

  // Returns false when no task has that id.
  bool apply(const TaskUpdate& u);

  // Number of items that matched a task.
  std::size_t apply(const UpdateBatch& batch);

  // Replaces the stored task with the same id. Returns false when absent.
  bool restore(const Task& snapshot);

  // Bumped on every successful write.
  std::uint64_t revision() const { return revision_; }

 private:
  Task* find_mut(const std::string& id);
  void reindex();

  std::vector<Task> tasks_;
  std::unordered_map<std::string, std::size_t> index_;
  std::uint64_t revision_{0};
};

// Sink that writes into a TaskStore. Unknown ids fail.
class StoreUpdateSink : public UpdateSink {
 public:
  explicit StoreUpdateSink(TaskStore& store) : store_(store) {}
  std::vector<UpdateOutcome> apply_updates(const UpdateBatch& batch) override;

 private:
  TaskStore& store_;
};

struct CommitResult {
  // True when the sink accepted every item (also true for an empty commit).
  bool ok{true};

  // Items applied to the mirror before the sink was called.
  std::size_t optimistic_applied{0};

  std::vector<UpdateOutcome> failures;

  // Ids restored to their pre-commit values (RollbackPolicy::Restore only).
  std::vector<std::string> rolled_back;
};

// Applies a drag commit: the mirror is updated once, up front, then the whole
// batch goes to the sink in a single call. A successful sink leaves the mirror
// as is. Failed items are rolled back in the mirror only under
// RollbackPolicy::Restore. An exception thrown by the sink is reported as a
// failure of every item.
CommitResult apply_commit(const DragCommit& commit, TaskStore& mirror, UpdateSink& sink, RollbackPolicy policy);

} // namespace sitetrack
