#pragma once

#include "engine.hh"

/**
 * Runs the tasks of one job at a time, one task at a time, on the calling thread. The first task to fail aborts
 * its job: nothing else in that job is started, and the job is marked Failed with a message naming the task.
 */
class SequentialEngine : public Engine
{
  void run_job( Job& job );

protected:
  virtual void run_all() override;
  virtual const char* name() const override { return "SequentialEngine"; }

public:
  using Engine::Engine;

  /// Runs @p task to completion, recording its outcome on the task. Never throws for a task failure.
  void run_task( Task& task );
};
