#include "job.hh"

#include <array>

#include <glog/logging.h>

#include "util.hh"

using namespace std;

ostream& operator<<( ostream& s, JobStatus status )
{
  static constexpr array<const char*, 4> names { "QUEUED", "RUNNING", "FINISHED", "FAILED" };
  return s << names.at( to_underlying( status ) );
}

JobError::JobError( const Task& task )
  : runtime_error( "Task " + task.task_id() + " failed. Reason: " + task.failure_message() )
  , task_id_( task.task_id() )
  , failure_( task.failed() ? task.result()->error() : TaskFailure {} )
{}

Job::Job( string job_id )
  : job_id_( move( job_id ) )
{
  if ( job_id_.empty() ) {
    throw invalid_argument( "job id must not be empty" );
  }
}

void Job::start()
{
  if ( status_ == JobStatus::Queued ) {
    status_ = JobStatus::Running;
  }
}

bool Job::update_status()
{
  if ( terminal() ) {
    return true;
  }
  if ( not tasks_.exhausted() ) {
    return false;
  }

  status_ = tasks_.all_finished() ? JobStatus::Finished : JobStatus::Failed;
  if ( status_ == JobStatus::Finished ) {
    LOG( INFO ) << *this << " finished";
  } else {
    LOG( WARNING ) << *this << " failed";
  }
  return true;
}

void Job::abort( const JobError& error )
{
  status_ = JobStatus::Failed;
  error_message_ = error.what();
  failed_task_id_ = error.task_id();
  LOG( ERROR ) << *this << " aborted: " << error_message_;
}

ostream& operator<<( ostream& s, const Job& job )
{
  return s << "Job( " << job.job_id_ << " )";
}
