#include "sitetrack/core/task_graph.h"

#include <algorithm>
#include <unordered_set>

#include "sitetrack/util/log.h"

namespace sitetrack {

TaskGraph::TaskGraph(const std::vector<Task>& tasks) : tasks_(tasks) {
  index_.reserve(tasks.size() * 2 + 8);
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    const Task& t = tasks[i];
    if (!index_.emplace(t.id, i).second) {
      log::warn("duplicate task id '" + t.id + "'; later entries are ignored by lookups");
    }
    if (t.has_parent()) children_[t.parent_task_id].push_back(i);

    for (std::size_t p = 0; p < t.predecessors.size(); ++p) {
      const std::string& pred = t.predecessors[p];
      if (pred.empty()) continue;
      // A repeated predecessor id must not produce a duplicate edge.
      if (std::find(t.predecessors.begin(), t.predecessors.begin() + static_cast<std::ptrdiff_t>(p), pred) !=
          t.predecessors.begin() + static_cast<std::ptrdiff_t>(p)) {
        continue;
      }
      successors_[pred].push_back(i);
    }
  }
}

const Task* TaskGraph::find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return nullptr;
  return &tasks_[it->second];
}

std::vector<const Task*> TaskGraph::children_of(const std::string& id) const {
  std::vector<const Task*> out;
  auto it = children_.find(id);
  if (it == children_.end()) return out;
  out.reserve(it->second.size());
  for (std::size_t idx : it->second) out.push_back(&tasks_[idx]);
  return out;
}

bool TaskGraph::has_children(const std::string& id) const {
  auto it = children_.find(id);
  return it != children_.end() && !it->second.empty();
}

std::vector<const Task*> TaskGraph::leaf_tasks() const {
  std::vector<const Task*> out;
  out.reserve(tasks_.size());
  for (const auto& t : tasks_) {
    if (is_leaf(t.id)) out.push_back(&t);
  }
  return out;
}

std::vector<const Task*> TaskGraph::leaf_descendants_of(const std::string& id) const {
  std::vector<const Task*> out;
  std::unordered_set<std::string> visited{id};

  // Explicit stack of (parent id, next child position) keeps collection order
  // without recursion.
  struct Frame {
    const std::vector<std::size_t>* kids;
    std::size_t next;
  };
  std::vector<Frame> stack;
  auto push = [&](const std::string& parent) {
    auto it = children_.find(parent);
    if (it != children_.end()) stack.push_back(Frame{&it->second, 0});
  };
  push(id);

  while (!stack.empty()) {
    Frame& f = stack.back();
    if (f.next >= f.kids->size()) {
      stack.pop_back();
      continue;
    }
    const Task& child = tasks_[(*f.kids)[f.next++]];
    if (!visited.insert(child.id).second) {
      log::warn("parent cycle detected at task '" + child.id + "'");
      continue;
    }
    if (child.is_group()) {
      push(child.id);
    } else {
      out.push_back(&child);
    }
  }
  return out;
}

std::vector<std::string> TaskGraph::all_descendant_ids(const std::string& id) const {
  std::vector<std::string> out;
  std::unordered_set<std::string> visited{id};

  struct Frame {
    const std::vector<std::size_t>* kids;
    std::size_t next;
  };
  std::vector<Frame> stack;
  auto push = [&](const std::string& parent) {
    auto it = children_.find(parent);
    if (it != children_.end()) stack.push_back(Frame{&it->second, 0});
  };
  push(id);

  while (!stack.empty()) {
    Frame& f = stack.back();
    if (f.next >= f.kids->size()) {
      stack.pop_back();
      continue;
    }
    const Task& child = tasks_[(*f.kids)[f.next++]];
    if (!visited.insert(child.id).second) {
      log::warn("parent cycle detected at task '" + child.id + "'");
      continue;
    }
    out.push_back(child.id);
    push(child.id);
  }
  return out;
}

std::vector<const Task*> TaskGraph::successors_of(const std::string& id) const {
  std::vector<const Task*> out;
  auto it = successors_.find(id);
  if (it == successors_.end()) return out;
  out.reserve(it->second.size());
  for (std::size_t idx : it->second) out.push_back(&tasks_[idx]);
  return out;
}

bool TaskGraph::is_descendant(const std::string& candidate_id, const std::string& ancestor_id) const {
  std::unordered_set<std::string> visited{candidate_id};
  const Task* cur = find(candidate_id);
  while (cur && cur->has_parent()) {
    if (cur->parent_task_id == ancestor_id) return true;
    if (!visited.insert(cur->parent_task_id).second) {
      log::warn("parent cycle detected while walking up from task '" + candidate_id + "'");
      return false;
    }
    cur = find(cur->parent_task_id);
  }
  return false;
}

} // namespace sitetrack
