#pragma once

#include <any>
#include <cstdint>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "resources.hh"

/// The kinds of Task a job can contain; each kind gets its own entry in a RunnerRegistry.
enum class TaskKind : uint8_t
{
  Install,
  Input,
  Step,
  Output,
};

/// The types of application a Task can execute; used as the secondary key for polymorphic task kinds.
enum class AppType : uint8_t
{
  CommandLineTool,
  Script,
  Workflow,
  Mock,
};

enum class TaskStatus : uint8_t
{
  Waiting,
  Ready,
  Running,
  Finished,
  Failed,
};

std::ostream& operator<<( std::ostream& s, TaskKind kind );
std::ostream& operator<<( std::ostream& s, AppType type );
std::ostream& operator<<( std::ostream& s, TaskStatus status );

/**
 * A reference to what a Task executes. The engine only looks at the type; everything else is for the Runner.
 */
struct App
{
  std::string id;
  AppType type { AppType::CommandLineTool };
};

/**
 * The captured failure of a Task: a readable message plus the exception that was thrown, if there was one.
 */
struct TaskFailure
{
  std::string message;
  std::exception_ptr exception {};

  /// Captures the exception currently being handled. Must be called from inside a catch block.
  static TaskFailure current();
};

using TaskResult = std::expected<std::any, TaskFailure>;

class TaskGraph;

/**
 * A "Task" is the smallest schedulable unit of work: one invocation of one App, executed by one Runner.
 *
 * Tasks are created through TaskGraph::add_task and are owned by the graph. Their status and result are mutated
 * only by an engine's control thread; Runners may read the id, kind, app and arguments from a worker thread while
 * the task is Running.
 */
class Task
{
  friend class TaskGraph;

  std::string task_id_;
  TaskKind kind_;
  std::shared_ptr<const App> app_;
  std::any arguments_;

  TaskStatus status_ { TaskStatus::Waiting };
  std::optional<ResourceRequest> resources_ {};
  std::optional<TaskResult> result_ {};

public:
  Task( std::string task_id,
        TaskKind kind,
        std::shared_ptr<const App> app,
        std::any arguments = {},
        std::optional<ResourceRequest> resources = {} );

  Task( const Task& ) = delete;
  Task& operator=( const Task& ) = delete;

  const std::string& task_id() const { return task_id_; }
  TaskKind kind() const { return kind_; }
  const App& app() const { return *app_; }
  const std::any& arguments() const { return arguments_; }

  TaskStatus status() const { return status_; }
  const std::optional<ResourceRequest>& resources() const { return resources_; }
  const std::optional<TaskResult>& result() const { return result_; }

  bool finished() const { return status_ == TaskStatus::Finished; }
  bool failed() const { return status_ == TaskStatus::Failed; }
  bool terminal() const { return finished() or failed(); }

  /// Fills in the resource request; a request already attached is never replaced.
  void set_resources( const ResourceRequest& request );

  /** @defgroup Engine-side state transitions
   * @{
   */
  void start();
  void finish( std::any value );
  void fail( TaskFailure failure );
  /* }@ */

  /// The failure message of a Failed task, or an empty string.
  std::string failure_message() const;

  friend std::ostream& operator<<( std::ostream& s, const Task& task );
};
