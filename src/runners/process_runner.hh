#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "runner.hh"

class ProcessError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Runs a task as a local child process. The task's arguments must be a std::vector<std::string> holding the argv;
 * argv[0] is looked up on PATH. The value of a successful run is the exit status (always 0), as an int.
 */
class ProcessRunner : public Runner
{
  const Task& task_;
  ResourceRequest requirements_;

public:
  ProcessRunner( const Task& task, ResourceRequest requirements = {} )
    : task_( task )
    , requirements_( requirements )
  {}

  /// @throws ProcessError if the process cannot be started, exits non-zero, or is killed by a signal.
  virtual std::any run() override;

  virtual ResourceRequest get_requirements() override { return requirements_; }

  static RunnerFactory factory( ResourceRequest requirements = {} )
  {
    return [requirements]( const Task& task ) { return std::make_unique<ProcessRunner>( task, requirements ); };
  }
};
