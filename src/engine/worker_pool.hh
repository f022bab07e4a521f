#pragma once

#include <any>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "channel.hh"
#include "runner.hh"

/**
 * The pending outcome of a Runner submitted to a WorkerPool.
 */
class AsyncResult
{
  std::future<std::any> future_;

public:
  explicit AsyncResult( std::future<std::any>&& future )
    : future_( std::move( future ) )
  {}

  /// Non-blocking check for completion.
  bool ready() const;

  /// Returns the Runner's value, or rethrows what it threw. Only valid once, after ready().
  std::any get();
};

/**
 * A fixed-size pool of worker threads executing Runners. Runners travel to the workers over a Channel; results
 * come back through AsyncResult. Workers never touch engine state.
 */
class WorkerPool
{
  struct Work
  {
    std::unique_ptr<Runner> runner;
    std::promise<std::any> promise;
  };

  Channel<std::unique_ptr<Work>> runq_ {};
  std::vector<std::thread> threads_ {};

  void work( size_t worker_id );

public:
  explicit WorkerPool( size_t num_workers );

  WorkerPool( const WorkerPool& ) = delete;
  WorkerPool& operator=( const WorkerPool& ) = delete;

  /// Queues @p runner for execution on the next free worker.
  AsyncResult submit( std::unique_ptr<Runner> runner );

  size_t size() const { return threads_.size(); }

  /// Closes the run queue and joins the workers once they finish their current Runner.
  ~WorkerPool();
};
