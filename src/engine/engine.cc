#include "engine.hh"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <thread>

#include <glog/logging.h>
#include <unistd.h>

#include "util.hh"

using namespace std;

namespace {
uint64_t physical_memory_mb()
{
  long pages = sysconf( _SC_PHYS_PAGES );
  long page_size = sysconf( _SC_PAGE_SIZE );
  if ( pages <= 0 or page_size <= 0 ) {
    PLOG( WARNING ) << "could not determine physical memory";
    return 0;
  }
  return static_cast<uint64_t>( pages ) * static_cast<uint64_t>( page_size ) / ( 1024 * 1024 );
}

uint64_t positive( const char* name, optional<uint64_t> value, uint64_t fallback )
{
  if ( not value ) {
    return fallback;
  }
  if ( *value == 0 ) {
    throw invalid_argument( string( name ) + " must be positive" );
  }
  return *value;
}

/// @p value, if it does not exceed @p limit.
uint64_t at_most( const char* name, uint64_t value, uint64_t limit )
{
  if ( value > limit ) {
    throw invalid_argument( string( name ) + " is out of range: " + to_string( value ) + " exceeds "
                            + to_string( limit ) );
  }
  return value;
}
}

EngineConfig::EngineConfig()
  : ram_mb( physical_memory_mb() )
  , cpu_count( max( 1u, thread::hardware_concurrency() ) )
  , workers( cpu_count )
{}

EngineConfig EngineConfig::from_environment()
{
  EngineConfig config;
  config.ram_mb = env_u64( "PIPEWRIGHT_RAM_MB" ).value_or( config.ram_mb );
  // CPU_ALL is a request sentinel, so it cannot be a total.
  config.cpu_count = at_most( "PIPEWRIGHT_CPUS",
                              positive( "PIPEWRIGHT_CPUS", env_u64( "PIPEWRIGHT_CPUS" ), config.cpu_count ),
                              ResourceRequest::CPU_ALL - 1 );
  config.workers = at_most( "PIPEWRIGHT_WORKERS",
                            positive( "PIPEWRIGHT_WORKERS", env_u64( "PIPEWRIGHT_WORKERS" ), config.cpu_count ),
                            numeric_limits<size_t>::max() );
  config.poll_interval = chrono::milliseconds(
    at_most( "PIPEWRIGHT_POLL_MS",
             positive( "PIPEWRIGHT_POLL_MS", env_u64( "PIPEWRIGHT_POLL_MS" ), config.poll_interval.count() ),
             chrono::milliseconds::max().count() ) );
  return config;
}

Engine::Engine( shared_ptr<const RunnerRegistry> runners, Hook before_task, Hook after_task )
  : runners_( move( runners ) )
  , before_task_( before_task ? move( before_task ) : []( Task& ) {} )
  , after_task_( after_task ? move( after_task ) : []( Task& ) {} )
{
  if ( not runners_ ) {
    throw invalid_argument( "an engine needs a runner registry" );
  }
}

void Engine::run( const vector<shared_ptr<Job>>& jobs )
{
  for ( const auto& job : jobs ) {
    CHECK( job ) << "null job passed to " << *this;
    auto [it, inserted] = job_index_.try_emplace( job->job_id(), jobs_.size() );
    if ( inserted ) {
      jobs_.push_back( job );
    } else {
      jobs_[it->second] = job;
    }
  }

  LOG( INFO ) << "running " << *this;
  run_all();
}

void Engine::call_hook( const Hook& hook, const char* which, Task& task )
{
  try {
    hook( task );
  } catch ( const exception& e ) {
    LOG( ERROR ) << which << " hook threw on " << task << ": " << e.what();
  } catch ( ... ) {
    LOG( ERROR ) << which << " hook threw a non-standard exception on " << task;
  }
}

shared_ptr<Job> Engine::job( const string& job_id ) const
{
  auto it = job_index_.find( job_id );
  if ( it == job_index_.end() ) {
    return nullptr;
  }
  return jobs_[it->second];
}

ostream& operator<<( ostream& s, const Engine& engine )
{
  return s << engine.name() << "[" << engine.jobs_.size() << " jobs]";
}
