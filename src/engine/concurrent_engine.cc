#include "concurrent_engine.hh"

#include <thread>

#include <glog/logging.h>

using namespace std;

ConcurrentEngine::ConcurrentEngine( shared_ptr<const RunnerRegistry> runners,
                                    const EngineConfig& config,
                                    Hook before_task,
                                    Hook after_task )
  : Engine( move( runners ), move( before_task ), move( after_task ) )
  , ledger_( config.cpu_count, config.ram_mb )
  , poll_interval_( config.poll_interval )
  , pool_( config.workers )
{}

bool ConcurrentEngine::acquire_resources( const Task& task )
{
  CHECK( task.resources().has_value() ) << task << " has no resource request";
  return ledger_.acquire( *task.resources() );
}

void ConcurrentEngine::release_resources( const Task& task )
{
  CHECK( task.resources().has_value() ) << task << " has no resource request";
  ledger_.release( *task.resources() );
}

void ConcurrentEngine::reject( Job& job, Task& task )
{
  before_task( task );
  task.fail( TaskFailure::current() );
  LOG( ERROR ) << "Failed: " << task.task_id() << " could not be dispatched: " << task.failure_message();
  after_task( task );
  job.tasks().resolve_task( task );
}

size_t ConcurrentEngine::run_ready_tasks()
{
  size_t dispatched = 0;
  for ( const auto& job : jobs_ ) {
    if ( job->terminal() ) {
      continue;
    }

    for ( auto task : job->tasks().get_ready_tasks() ) {
      unique_ptr<Runner> runner;
      try {
        runner = get_runner( *task );
        if ( not task->resources() ) {
          task->set_resources( runner->get_requirements() );
        }
      } catch ( ... ) {
        reject( *job, *task );
        continue;
      }

      if ( not acquire_resources( *task ) ) {
        if ( not ledger_.satisfiable( *task->resources() ) and starving_.insert( task ).second ) {
          LOG( WARNING ) << *task << " requests " << *task->resources() << " but the engine only has "
                         << ledger_.total_cpu() << " cores and " << ledger_.total_ram()
                         << "MB; it will never run";
        }
        continue;
      }

      job->start();
      before_task( *task );
      task->start();
      LOG( INFO ) << "Running " << *task;
      VLOG( 1 ) << "[resources: " << ledger_ << "] " << *task << " holds " << *task->resources();
      running_.push_back( { job, task, pool_.submit( move( runner ) ) } );
      dispatched++;
    }
  }
  return dispatched;
}

void ConcurrentEngine::process_result( InFlight& item )
{
  auto& task = *item.task;
  try {
    task.finish( item.result.get() );
    LOG( INFO ) << "Finished: " << task;
  } catch ( ... ) {
    task.fail( TaskFailure::current() );
    LOG( ERROR ) << "Failed: " << task.task_id() << ": " << task.failure_message();
  }
  after_task( task );
  release_resources( task );
  item.job->tasks().resolve_task( task );
}

size_t ConcurrentEngine::poll()
{
  size_t completed = 0;
  for ( auto it = running_.begin(); it != running_.end(); ) {
    if ( not it->result.ready() ) {
      ++it;
      continue;
    }
    process_result( *it );
    it = running_.erase( it );
    completed++;
  }
  return completed;
}

bool ConcurrentEngine::update_jobs_check_ready()
{
  bool has_ready = false;
  for ( const auto& job : jobs_ ) {
    if ( not job->tasks().get_ready_tasks().empty() ) {
      has_ready = true;
      continue;
    }
    job->update_status();
  }
  return has_ready;
}

void ConcurrentEngine::run_all()
{
  while ( true ) {
    size_t dispatched = run_ready_tasks();
    size_t completed = poll();

    bool has_ready = update_jobs_check_ready();
    if ( running_.empty() and not has_ready ) {
      // Tasks can be freed once their job is replaced, so no address outlives the run.
      starving_.clear();
      return;
    }

    if ( dispatched == 0 and completed == 0 ) {
      VLOG( 2 ) << "nothing to do, " << running_.size() << " tasks in flight";
      this_thread::sleep_for( poll_interval_ );
    }
  }
}
