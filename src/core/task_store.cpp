#include "sitetrack/core/task_store.h"

#include <exception>
#include <unordered_set>
#include <utility>

#include "sitetrack/util/log.h"

namespace sitetrack {

TaskStore::TaskStore(std::vector<Task> tasks) : tasks_(std::move(tasks)) { reindex(); }

void TaskStore::reindex() {
  index_.clear();
  index_.reserve(tasks_.size() * 2 + 8);
  for (std::size_t i = 0; i < tasks_.size(); ++i) index_.emplace(tasks_[i].id, i);
}

const Task* TaskStore::find(const std::string& id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &tasks_[it->second];
}

Task* TaskStore::find_mut(const std::string& id) {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &tasks_[it->second];
}

bool TaskStore::apply(const TaskUpdate& u) {
  Task* t = find_mut(u.task_id);
  if (!t) return false;
  apply_task_update(*t, u);
  ++revision_;
  return true;
}

std::size_t TaskStore::apply(const UpdateBatch& batch) {
  std::size_t n = 0;
  for (const auto& u : batch) {
    if (apply(u)) ++n;
  }
  return n;
}

bool TaskStore::restore(const Task& snapshot) {
  Task* t = find_mut(snapshot.id);
  if (!t) return false;
  *t = snapshot;
  ++revision_;
  return true;
}

std::vector<UpdateOutcome> StoreUpdateSink::apply_updates(const UpdateBatch& batch) {
  std::vector<UpdateOutcome> out;
  out.reserve(batch.size());
  for (const auto& u : batch) {
    UpdateOutcome o;
    o.task_id = u.task_id;
    if (!store_.apply(u)) {
      o.ok = false;
      o.error = "unknown task id";
    }
    out.push_back(std::move(o));
  }
  return out;
}

CommitResult apply_commit(const DragCommit& commit, TaskStore& mirror, UpdateSink& sink, RollbackPolicy policy) {
  CommitResult r;
  if (commit.empty()) return r;

  std::unordered_map<std::string, Task> before;
  for (const auto& u : commit.updates) {
    if (const Task* t = mirror.find(u.task_id)) before.emplace(u.task_id, *t);
  }

  r.optimistic_applied = mirror.apply(commit.updates);

  std::vector<UpdateOutcome> outcomes;
  try {
    outcomes = sink.apply_updates(commit.updates);
  } catch (const std::exception& e) {
    log::error(std::string("commit: update sink threw: ") + e.what());
    outcomes.clear();
    for (const auto& u : commit.updates) outcomes.push_back(UpdateOutcome{u.task_id, false, e.what()});
  }

  std::unordered_set<std::string> answered;
  for (auto& o : outcomes) {
    answered.insert(o.task_id);
    if (!o.ok) r.failures.push_back(std::move(o));
  }
  // An item the sink never answered did not persist.
  for (const auto& u : commit.updates) {
    if (answered.count(u.task_id) == 0) r.failures.push_back(UpdateOutcome{u.task_id, false, "no outcome reported"});
  }
  r.ok = r.failures.empty();

  for (const auto& f : r.failures) {
    log::warn("commit: update for task '" + f.task_id + "' failed: " + f.error);
  }

  if (!r.ok && policy == RollbackPolicy::Restore) {
    for (const auto& f : r.failures) {
      auto it = before.find(f.task_id);
      if (it == before.end()) continue;
      if (mirror.restore(it->second)) r.rolled_back.push_back(f.task_id);
    }
    log::info("commit: restored " + std::to_string(r.rolled_back.size()) + " task(s) in the mirror");
  }

  return r;
}

} // namespace sitetrack
