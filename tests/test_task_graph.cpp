#include <iostream>
#include <type_traits>
#include <vector>

#include "sitetrack/core/task_graph.h"
#include "test.h"

#define ST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

// The graph borrows the collection, so a temporary must not bind to it.
static_assert(std::is_constructible<sitetrack::TaskGraph, const std::vector<sitetrack::Task>&>::value,
              "graph builds over a named collection");
static_assert(!std::is_constructible<sitetrack::TaskGraph, std::vector<sitetrack::Task>&&>::value,
              "graph must not bind to a temporary collection");

int test_task_graph() {
  using sitetrack::Task;
  using sitetrack::TaskGraph;
  using sitetrack::testing::make_group;
  using sitetrack::testing::make_task;

  // G
  // |- A
  // `- B (group)
  //    `- C
  // D (after A, listed twice), E (after D)
  std::vector<Task> tasks;
  tasks.push_back(make_group("G"));
  tasks.push_back(make_task("A", "2024-01-01", "2024-01-05", "G"));
  tasks.push_back(make_group("B", "G"));
  tasks.push_back(make_task("C", "2024-01-03", "2024-01-09", "B"));
  tasks.push_back(make_task("D", "2024-01-06", "2024-01-08"));
  tasks.back().predecessors = {"A", "A"};
  tasks.push_back(make_task("E", "2024-01-09", "2024-01-10"));
  tasks.back().predecessors = {"D"};

  const TaskGraph g(tasks);

  ST_ASSERT(g.contains("C"));
  ST_ASSERT(!g.contains("Z"));
  ST_ASSERT(g.find("Z") == nullptr);

  const auto kids = g.children_of("G");
  ST_ASSERT(kids.size() == 2);
  ST_ASSERT(kids[0]->id == "A");
  ST_ASSERT(kids[1]->id == "B");
  ST_ASSERT(g.children_of("A").empty());

  ST_ASSERT(!g.is_leaf("G"));
  ST_ASSERT(!g.is_leaf("B"));
  ST_ASSERT(g.is_leaf("A"));
  const auto leaves = g.leaf_tasks();
  ST_ASSERT(leaves.size() == 4);
  ST_ASSERT(leaves[0]->id == "A");
  ST_ASSERT(leaves[1]->id == "C");
  ST_ASSERT(leaves[2]->id == "D");
  ST_ASSERT(leaves[3]->id == "E");

  // Groups are expanded, never returned.
  const auto work = g.leaf_descendants_of("G");
  ST_ASSERT(work.size() == 2);
  ST_ASSERT(work[0]->id == "A");
  ST_ASSERT(work[1]->id == "C");

  // Pre-order, groups included.
  const auto all = g.all_descendant_ids("G");
  ST_ASSERT(all.size() == 3);
  ST_ASSERT(all[0] == "A");
  ST_ASSERT(all[1] == "B");
  ST_ASSERT(all[2] == "C");
  ST_ASSERT(g.all_descendant_ids("E").empty());

  // The repeated predecessor id yields one edge.
  const auto succ = g.successors_of("A");
  ST_ASSERT(succ.size() == 1);
  ST_ASSERT(succ[0]->id == "D");
  ST_ASSERT(g.successors_of("D").size() == 1);
  ST_ASSERT(g.successors_of("E").empty());

  ST_ASSERT(g.is_descendant("C", "G"));
  ST_ASSERT(g.is_descendant("C", "B"));
  ST_ASSERT(!g.is_descendant("G", "C"));
  ST_ASSERT(!g.is_descendant("D", "G"));

  // A parent cycle must terminate with a partial answer.
  std::vector<Task> cyclic;
  cyclic.push_back(make_group("X", "Y"));
  cyclic.push_back(make_group("Y", "X"));
  cyclic.push_back(make_task("L", "2024-01-01", "2024-01-02", "X"));
  const TaskGraph cg(cyclic);
  ST_ASSERT(!cg.is_descendant("X", "Z"));
  ST_ASSERT(cg.is_descendant("L", "Y"));
  const auto cyc_all = cg.all_descendant_ids("X");
  ST_ASSERT(cyc_all.size() == 2);
  const auto cyc_leaves = cg.leaf_descendants_of("X");
  ST_ASSERT(cyc_leaves.size() == 1);
  ST_ASSERT(cyc_leaves[0]->id == "L");

  return 0;
}
