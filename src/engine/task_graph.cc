#include "task_graph.hh"

#include <stdexcept>

#include <glog/logging.h>

using namespace std;

Task& TaskGraph::at( string_view task_id )
{
  auto task = find( task_id );
  if ( task == nullptr ) {
    throw invalid_argument( "unknown task \"" + string( task_id ) + "\"" );
  }
  return *task;
}

Task& TaskGraph::add_task( string task_id,
                           TaskKind kind,
                           shared_ptr<const App> app,
                           any arguments,
                           optional<ResourceRequest> resources )
{
  if ( by_id_.contains( task_id ) ) {
    throw invalid_argument( "duplicate task \"" + task_id + "\"" );
  }

  auto& task = tasks_.emplace_back(
    make_unique<Task>( move( task_id ), kind, move( app ), move( arguments ), resources ) );
  task->status_ = TaskStatus::Ready;
  by_id_.emplace( task->task_id(), task.get() );
  return *task;
}

void TaskGraph::add_dependency( string_view before_id, string_view after_id )
{
  if ( before_id == after_id ) {
    throw invalid_argument( "task \"" + string( before_id ) + "\" cannot depend on itself" );
  }

  Task& before = at( before_id );
  Task& after = at( after_id );
  if ( after.status() != TaskStatus::Waiting and after.status() != TaskStatus::Ready ) {
    throw invalid_argument( "cannot add a dependency to " + after.task_id() + ", it has already started" );
  }

  if ( not dependents_[&before].insert( &after ).second ) {
    return;
  }

  if ( before.finished() ) {
    return;
  }

  blockers_[&after].insert( &before );
  after.status_ = TaskStatus::Waiting;
  VLOG( 2 ) << after << " is blocked on " << before;
}

vector<Task*> TaskGraph::get_ready_tasks() const
{
  vector<Task*> ready;
  for ( const auto& task : tasks_ ) {
    if ( task->status() == TaskStatus::Ready ) {
      ready.push_back( task.get() );
    }
  }
  return ready;
}

void TaskGraph::resolve_task( Task& task )
{
  CHECK( find( task.task_id() ) == &task ) << task << " does not belong to this graph";
  CHECK( task.terminal() ) << task << " resolved while " << task.status();

  if ( not resolved_.insert( &task ).second ) {
    LOG( WARNING ) << task << " was already resolved";
    return;
  }

  if ( task.failed() ) {
    VLOG( 1 ) << task << " failed; its dependents stay blocked";
    return;
  }

  auto it = dependents_.find( &task );
  if ( it == dependents_.end() ) {
    return;
  }

  for ( auto dependent : it->second ) {
    auto& remaining = blockers_[dependent];
    remaining.erase( &task );
    if ( remaining.empty() ) {
      blockers_.erase( dependent );
      if ( dependent->status() == TaskStatus::Waiting ) {
        VLOG( 1 ) << *dependent << " is unblocked";
        dependent->status_ = TaskStatus::Ready;
      }
    } else {
      VLOG( 2 ) << *dependent << " is waiting on " << remaining.size() << " tasks";
    }
  }
}

bool TaskGraph::exhausted() const
{
  for ( const auto& task : tasks_ ) {
    if ( task->status() == TaskStatus::Ready or task->status() == TaskStatus::Running ) {
      return false;
    }
  }
  return true;
}

bool TaskGraph::all_finished() const
{
  for ( const auto& task : tasks_ ) {
    if ( not task->finished() ) {
      return false;
    }
  }
  return true;
}

Task* TaskGraph::find( string_view task_id ) const
{
  auto it = by_id_.find( task_id );
  if ( it == by_id_.end() ) {
    return nullptr;
  }
  return it->second;
}

vector<Task*> TaskGraph::iter_tasks() const
{
  vector<Task*> all;
  all.reserve( tasks_.size() );
  for ( const auto& task : tasks_ ) {
    all.push_back( task.get() );
  }
  return all;
}
