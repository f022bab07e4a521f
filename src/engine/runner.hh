#pragma once

#include <any>
#include <functional>
#include <memory>

#include "resources.hh"
#include "task.hh"

/**
 * An execution strategy for one Task. A Runner is created on the engine's control thread, bound to its Task, and
 * may then be run on a worker thread. It must not change the Task or any other engine state: it computes and
 * returns a value, or throws.
 */
class Runner
{
public:
  /// Performs the task's work. Any exception thrown is captured as the task's failure.
  virtual std::any run() = 0;

  /// The resources this task needs, consulted when the task has none attached.
  virtual ResourceRequest get_requirements() = 0;

  virtual ~Runner() {}
};

using RunnerFactory = std::function<std::unique_ptr<Runner>( const Task& )>;

/**
 * A Runner which calls a function. Useful for tasks that are in-process sub-computations.
 */
class FunctionRunner : public Runner
{
public:
  using Function = std::function<std::any( const Task& )>;

private:
  const Task& task_;
  Function function_;
  ResourceRequest requirements_;

public:
  FunctionRunner( const Task& task, Function function, ResourceRequest requirements = {} )
    : task_( task )
    , function_( std::move( function ) )
    , requirements_( requirements )
  {}

  virtual std::any run() override { return function_( task_ ); }
  virtual ResourceRequest get_requirements() override { return requirements_; }

  /// A factory binding @p function to each task it is asked for.
  static RunnerFactory factory( Function function, ResourceRequest requirements = {} )
  {
    return [function = std::move( function ), requirements]( const Task& task ) {
      return std::make_unique<FunctionRunner>( task, function, requirements );
    };
  }
};
