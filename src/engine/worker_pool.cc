#include "worker_pool.hh"

#include <chrono>
#include <stdexcept>

#include <glog/logging.h>

using namespace std;

bool AsyncResult::ready() const
{
  return future_.wait_for( chrono::seconds( 0 ) ) == future_status::ready;
}

any AsyncResult::get()
{
  return future_.get();
}

WorkerPool::WorkerPool( size_t num_workers )
{
  if ( num_workers == 0 ) {
    throw invalid_argument( "worker pool needs at least one worker" );
  }

  threads_.reserve( num_workers );
  for ( size_t i = 0; i < num_workers; i++ ) {
    threads_.emplace_back( [this, i] { work( i ); } );
  }
  VLOG( 1 ) << "worker pool started with " << num_workers << " workers";
}

WorkerPool::~WorkerPool()
{
  runq_.close();
  for ( auto& thread : threads_ ) {
    thread.join();
  }
}

AsyncResult WorkerPool::submit( unique_ptr<Runner> runner )
{
  CHECK( runner );
  auto work = make_unique<Work>();
  work->runner = move( runner );
  AsyncResult result( work->promise.get_future() );
  runq_ << move( work );
  return result;
}

void WorkerPool::work( size_t worker_id )
{
  unique_ptr<Work> next;
  try {
    while ( true ) {
      runq_ >> next;
      if ( not next ) {
        continue;
      }

      VLOG( 2 ) << "worker " << worker_id << " picked up a runner";
      try {
        next->promise.set_value( next->runner->run() );
      } catch ( ... ) {
        next->promise.set_exception( current_exception() );
      }
      next.reset();
    }
  } catch ( ChannelClosed& ) {
    VLOG( 2 ) << "worker " << worker_id << " stopped";
  }
}
