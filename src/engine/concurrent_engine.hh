#pragma once

#include <chrono>
#include <list>
#include <memory>

#include <absl/container/flat_hash_set.h>

#include "engine.hh"
#include "resource_ledger.hh"
#include "worker_pool.hh"

/**
 * Runs ready tasks of every job concurrently on a fixed-size WorkerPool, admitting a task only when the
 * ResourceLedger can satisfy its request. The control loop runs on the calling thread: it dispatches what fits,
 * polls in-flight tasks without blocking, and applies every status change and resource release itself.
 *
 * A failed task does not stop anything else: independent branches run to completion, and a job is marked Failed
 * only once its graph is exhausted with at least one task unfinished.
 *
 * A task whose request can never be satisfied is retried forever.
 */
class ConcurrentEngine : public Engine
{
  struct InFlight
  {
    std::shared_ptr<Job> job;
    Task* task;
    AsyncResult result;
  };

  ResourceLedger ledger_;
  std::chrono::milliseconds poll_interval_;
  std::list<InFlight> running_ {};
  absl::flat_hash_set<const Task*> starving_ {};

  /// Must be declared last, so the workers are joined before anything they could still reference goes away.
  WorkerPool pool_;

  /// Fails a ready task that could not be handed to a worker. Must be called from inside a catch block.
  void reject( Job& job, Task& task );

  /// @return  The number of tasks dispatched.
  size_t run_ready_tasks();

  /// @return  The number of in-flight tasks which completed.
  size_t poll();

  void process_result( InFlight& item );

  /// Recomputes job statuses. @return Whether any job still has a non-empty ready frontier.
  bool update_jobs_check_ready();

protected:
  virtual void run_all() override;
  virtual const char* name() const override { return "ConcurrentEngine"; }

public:
  ConcurrentEngine( std::shared_ptr<const RunnerRegistry> runners,
                    const EngineConfig& config = {},
                    Hook before_task = {},
                    Hook after_task = {} );

  /**
   * Admits @p task if the ledger can satisfy its request right now.
   *
   * @p task  A task with resources attached.
   * @return  Whether the resources were taken.
   */
  bool acquire_resources( const Task& task );

  /// Gives back the resources @p task was admitted with.
  void release_resources( const Task& task );

  const ResourceLedger& ledger() const { return ledger_; }
  size_t in_flight() const { return running_.size(); }

  /// Ready tasks warned about because their request exceeds the ledger's totals.
  size_t starving() const { return starving_.size(); }
};
