#include "sequential_engine.hh"

#include <glog/logging.h>

using namespace std;

void SequentialEngine::run_task( Task& task )
{
  task.start();
  try {
    auto runner = get_runner( task );
    task.finish( runner->run() );
    LOG( INFO ) << "Finished: " << task;
  } catch ( ... ) {
    task.fail( TaskFailure::current() );
    LOG( ERROR ) << "Task error (" << task.task_id() << "): " << task.failure_message();
  }
}

void SequentialEngine::run_job( Job& job )
{
  LOG( INFO ) << "Running " << job;
  auto ready = job.tasks().get_ready_tasks();
  while ( not ready.empty() ) {
    for ( auto task : ready ) {
      before_task( *task );
      run_task( *task );
      after_task( *task );
      if ( task->failed() ) {
        throw JobError( *task );
      }
      job.tasks().resolve_task( *task );
    }
    ready = job.tasks().get_ready_tasks();
  }
}

void SequentialEngine::run_all()
{
  for ( const auto& job : jobs_ ) {
    if ( job->status() != JobStatus::Queued ) {
      continue;
    }

    job->start();
    try {
      run_job( *job );
      job->update_status();
    } catch ( const JobError& e ) {
      job->abort( e );
    }
  }
}
