#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "task.hh"

/**
 * The dependency structure of one Job: a directed acyclic graph over Tasks where an edge means "must finish
 * before". The graph owns its Tasks and maintains their Waiting/Ready status; it computes the ready frontier and
 * advances it as tasks are resolved.
 *
 * This class is not thread-safe. Engines touch it only from their control thread.
 */
class TaskGraph
{
  std::vector<std::unique_ptr<Task>> tasks_ {};
  absl::flat_hash_map<std::string, Task*> by_id_ {};

  /// Maps a Task to the Tasks which cannot start until it finishes.
  absl::flat_hash_map<const Task*, absl::flat_hash_set<Task*>> dependents_ {};
  /// Maps a Task to its predecessors which have not finished yet.
  absl::flat_hash_map<const Task*, absl::flat_hash_set<const Task*>> blockers_ {};

  absl::flat_hash_set<const Task*> resolved_ {};

  Task& at( std::string_view task_id );

public:
  TaskGraph() {}

  TaskGraph( const TaskGraph& ) = delete;
  TaskGraph& operator=( const TaskGraph& ) = delete;

  /**
   * Adds a Task with no dependencies; it starts out Ready.
   *
   * @throws std::invalid_argument if a task with the same id already exists.
   */
  Task& add_task( std::string task_id,
                  TaskKind kind,
                  std::shared_ptr<const App> app,
                  std::any arguments = {},
                  std::optional<ResourceRequest> resources = {} );

  /**
   * Records that @p before must finish before @p after may start. Both tasks must exist and must not have
   * started yet. Adding an edge twice has no further effect.
   *
   * @throws std::invalid_argument on unknown ids, a self-edge, or a task that already started.
   */
  void add_dependency( std::string_view before, std::string_view after );

  /// The ready frontier: tasks whose predecessors have all finished and which have not started.
  std::vector<Task*> get_ready_tasks() const;

  /**
   * Marks a terminal Task as resolved. For a Finished task, dependents with no remaining unfinished predecessor
   * join the ready frontier. A Failed task releases nothing. Resolving the same task twice is a no-op.
   *
   * @p task  A Finished or Failed Task of this graph.
   */
  void resolve_task( Task& task );

  /// True once no task is Ready or Running, i.e. no further progress is possible.
  bool exhausted() const;

  bool all_finished() const;

  Task* find( std::string_view task_id ) const;

  std::vector<Task*> iter_tasks() const;

  size_t size() const { return tasks_.size(); }
  bool empty() const { return tasks_.empty(); }
};
