#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "job.hh"
#include "runner_registry.hh"

/**
 * Construction parameters of an engine. Only ConcurrentEngine uses the resource and pool settings.
 */
struct EngineConfig
{
  uint64_t ram_mb;
  uint32_t cpu_count;
  size_t workers;
  std::chrono::milliseconds poll_interval { 100 };

  /// Host introspection: all cores as workers plus the physical memory of the machine.
  EngineConfig();

  /**
   * The defaults, overridden by PIPEWRIGHT_RAM_MB, PIPEWRIGHT_CPUS, PIPEWRIGHT_WORKERS and PIPEWRIGHT_POLL_MS
   * where set.
   *
   * @throws std::invalid_argument if a variable is malformed or zero.
   */
  static EngineConfig from_environment();
};

/**
 * Owns a set of Jobs and executes their Tasks. Subclasses decide how: see SequentialEngine and ConcurrentEngine.
 */
class Engine
{
public:
  using Hook = std::function<void( Task& )>;

protected:
  std::shared_ptr<const RunnerRegistry> runners_;
  Hook before_task_;
  Hook after_task_;

  std::vector<std::shared_ptr<Job>> jobs_ {};
  absl::flat_hash_map<std::string, size_t> job_index_ {};

  /// Strategy-specific execution of every registered job.
  virtual void run_all() = 0;

  virtual const char* name() const = 0;

  /// Hooks are observers: an exception thrown by one is logged and goes no further.
  static void call_hook( const Hook& hook, const char* which, Task& task );
  void before_task( Task& task ) { call_hook( before_task_, "before_task", task ); }
  void after_task( Task& task ) { call_hook( after_task_, "after_task", task ); }

public:
  Engine( std::shared_ptr<const RunnerRegistry> runners, Hook before_task = {}, Hook after_task = {} );

  Engine( const Engine& ) = delete;
  Engine& operator=( const Engine& ) = delete;

  /**
   * Registers @p jobs and runs every registered job until no further progress is possible. Blocks the calling
   * thread. A job whose id is already registered replaces the earlier one.
   */
  void run( const std::vector<std::shared_ptr<Job>>& jobs );

  template<typename... Jobs>
    requires( std::convertible_to<Jobs, std::shared_ptr<Job>> and ... )
  void run( Jobs&&... jobs )
  {
    run( std::vector<std::shared_ptr<Job>> { std::forward<Jobs>( jobs )... } );
  }

  /// Creates the Runner responsible for @p task. Throws UnknownRunner if there is none.
  std::unique_ptr<Runner> get_runner( const Task& task ) const { return runners_->make( task ); }

  const std::vector<std::shared_ptr<Job>>& jobs() const { return jobs_; }
  std::shared_ptr<Job> job( const std::string& job_id ) const;

  virtual ~Engine() {}

  friend std::ostream& operator<<( std::ostream& s, const Engine& engine );
};
