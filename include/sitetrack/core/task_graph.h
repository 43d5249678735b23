#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "sitetrack/core/entities.h"

namespace sitetrack {

// Read-only adjacency index over a flat task collection.
//
// Built once per computation pass. Hierarchy edges come from parent_task_id and
// dependency edges from each task's predecessor list (predecessor -> successor).
//
// The graph references the caller's vector; it must outlive the graph and must
// not be resized while the graph is in use.
//
// Every traversal keeps a visited set, so a malformed collection (a parent
// cycle, a predecessor loop) yields a partial result instead of hanging.
class TaskGraph {
 public:
  explicit TaskGraph(const std::vector<Task>& tasks);
  explicit TaskGraph(std::vector<Task>&&) = delete;

  const std::vector<Task>& tasks() const { return tasks_; }

  const Task* find(const std::string& id) const;
  bool contains(const std::string& id) const { return find(id) != nullptr; }

  // Direct children, in collection order.
  std::vector<const Task*> children_of(const std::string& id) const;
  bool has_children(const std::string& id) const;

  // A leaf has no children in the collection, whatever its type.
  bool is_leaf(const std::string& id) const { return !has_children(id); }
  std::vector<const Task*> leaf_tasks() const;

  // Deep query used for progress rollups: children of type group are expanded
  // rather than included, so only work items are returned.
  std::vector<const Task*> leaf_descendants_of(const std::string& id) const;

  // Every direct and indirect descendant id (groups included), pre-order.
  // Used to cascade a hierarchy move.
  std::vector<std::string> all_descendant_ids(const std::string& id) const;

  // Tasks whose predecessor list contains `id`, in collection order.
  std::vector<const Task*> successors_of(const std::string& id) const;

  // True when `candidate_id` sits somewhere below `ancestor_id` in the parent
  // chain. Call before re-parenting to stop a group from being dropped inside
  // its own subtree. A cyclic chain answers false.
  bool is_descendant(const std::string& candidate_id, const std::string& ancestor_id) const;

 private:
  const std::vector<Task>& tasks_;
  std::unordered_map<std::string, std::size_t> index_;
  std::unordered_map<std::string, std::vector<std::size_t>> children_;
  std::unordered_map<std::string, std::vector<std::size_t>> successors_;
};

} // namespace sitetrack
