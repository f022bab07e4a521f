#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "sequential_engine.hh"
#include "test.hh"

using namespace std;

static void linear_chain()
{
  Probe probe;
  SequentialEngine engine( probe_registry( probe ), probe.before(), probe.after() );

  auto job = make_shared<Job>( "chain" );
  step( *job, "c" );
  step( *job, "b" );
  step( *job, "a" );
  job->tasks().add_dependency( "a", "b" );
  job->tasks().add_dependency( "b", "c" );

  engine.run( job );

  CHECK_EQ( job->status(), JobStatus::Finished );
  CHECK( probe.started() == ( vector<string> { "a", "b", "c" } ) );
  CHECK( probe.hooked() == ( vector<string> { "before:a", "after:a", "before:b", "after:b", "before:c", "after:c" } ) );
  for ( auto task : job->tasks().iter_tasks() ) {
    CHECK_EQ( value_of( *task ), task->task_id() );
  }
  CHECK( job->error_message().empty() );
}

static void fan_out_failure()
{
  Probe probe;
  SequentialEngine engine( probe_registry( probe ), probe.before(), probe.after() );

  auto job = make_shared<Job>( "fan-out" );
  step( *job, "fail-root" );
  step( *job, "b" );
  step( *job, "c" );
  job->tasks().add_dependency( "fail-root", "b" );
  job->tasks().add_dependency( "fail-root", "c" );

  engine.run( job );

  CHECK_EQ( job->status(), JobStatus::Failed );
  CHECK( job->failed_task_id() == "fail-root" );
  CHECK_NE( job->error_message().find( "fail-root" ), string::npos );
  CHECK_NE( job->error_message().find( "boom in fail-root" ), string::npos );

  CHECK( probe.started() == vector<string> { "fail-root" } );
  auto root = job->tasks().find( "fail-root" );
  CHECK( root->failed() );
  CHECK( not root->result()->has_value() );
  CHECK_EQ( root->result()->error().message, "boom in fail-root" );
  CHECK( root->result()->error().exception );
  CHECK_EQ( job->tasks().find( "b" )->status(), TaskStatus::Waiting );
  CHECK_EQ( job->tasks().find( "c" )->status(), TaskStatus::Waiting );
}

static void abort_skips_rest_of_batch()
{
  Probe probe;
  SequentialEngine engine( probe_registry( probe ) );

  auto job = make_shared<Job>( "batch" );
  step( *job, "first" );
  step( *job, "fail-second" );
  step( *job, "third" );

  engine.run( job );

  CHECK_EQ( job->status(), JobStatus::Failed );
  CHECK( probe.started() == ( vector<string> { "first", "fail-second" } ) );
  CHECK_EQ( job->tasks().find( "third" )->status(), TaskStatus::Ready );
}

static void failures_stay_inside_their_job()
{
  Probe probe;
  SequentialEngine engine( probe_registry( probe ) );

  auto bad = make_shared<Job>( "bad" );
  step( *bad, "fail-here" );
  auto good = make_shared<Job>( "good" );
  step( *good, "fine" );

  engine.run( bad, good );

  CHECK_EQ( bad->status(), JobStatus::Failed );
  CHECK_EQ( good->status(), JobStatus::Finished );
  CHECK_EQ( value_of( *good->tasks().find( "fine" ) ), "fine" );
}

static void unknown_runner_fails_task()
{
  SequentialEngine engine( make_shared<RunnerRegistry>() );
  auto job = make_shared<Job>( "orphan" );
  step( *job, "lonely" );

  engine.run( job );

  CHECK_EQ( job->status(), JobStatus::Failed );
  CHECK( job->tasks().find( "lonely" )->failed() );
  CHECK_NE( job->error_message().find( "no runner registered" ), string::npos );
}

static void throwing_hooks()
{
  Probe probe;
  auto before = []( Task& task ) {
    if ( task.task_id() == "first" ) {
      throw runtime_error( "before hook failed" );
    }
  };
  auto after = []( Task& ) { throw logic_error( "after hook failed" ); };
  SequentialEngine engine( probe_registry( probe ), before, after );

  auto job = make_shared<Job>( "hooked" );
  step( *job, "first" );
  step( *job, "second" );
  job->tasks().add_dependency( "first", "second" );

  engine.run( job );
  CHECK_EQ( job->status(), JobStatus::Finished );
  CHECK( probe.started() == ( vector<string> { "first", "second" } ) );
  CHECK_EQ( value_of( *job->tasks().find( "second" ) ), "second" );
}

static void rerun_skips_finished_jobs()
{
  Probe probe;
  SequentialEngine engine( probe_registry( probe ) );

  auto first = make_shared<Job>( "first" );
  step( *first, "one" );
  engine.run( first );
  CHECK_EQ( first->status(), JobStatus::Finished );

  auto second = make_shared<Job>( "second" );
  step( *second, "two" );
  engine.run( second );
  CHECK_EQ( second->status(), JobStatus::Finished );

  CHECK( probe.started() == ( vector<string> { "one", "two" } ) );
  CHECK_EQ( engine.jobs().size(), 2u );
  CHECK( engine.job( "first" ) == first );

  engine.run();
  CHECK( probe.started().size() == 2 );
}

static void cycle_is_a_failure()
{
  Probe probe;
  SequentialEngine engine( probe_registry( probe ) );

  auto job = make_shared<Job>( "cycle" );
  step( *job, "x" );
  step( *job, "y" );
  job->tasks().add_dependency( "x", "y" );
  job->tasks().add_dependency( "y", "x" );

  engine.run( job );
  CHECK_EQ( job->status(), JobStatus::Failed );
  CHECK( probe.started().empty() );
}

void test( void )
{
  linear_chain();
  fan_out_failure();
  abort_skips_rest_of_batch();
  failures_stay_inside_their_job();
  unknown_runner_fails_task();
  throwing_hooks();
  rerun_skips_finished_jobs();
  cycle_is_a_failure();
}
