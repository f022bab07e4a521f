#include "task.hh"

#include <array>
#include <stdexcept>

#include <glog/logging.h>

#include "util.hh"

using namespace std;

namespace {
constexpr array<const char*, 4> kind_names { "Install", "Input", "Step", "Output" };
constexpr array<const char*, 4> app_type_names { "CommandLineTool", "Script", "Workflow", "Mock" };
constexpr array<const char*, 5> status_names { "WAITING", "READY", "RUNNING", "FINISHED", "FAILED" };
}

ostream& operator<<( ostream& s, TaskKind kind )
{
  return s << kind_names.at( to_underlying( kind ) );
}

ostream& operator<<( ostream& s, AppType type )
{
  return s << app_type_names.at( to_underlying( type ) );
}

ostream& operator<<( ostream& s, TaskStatus status )
{
  return s << status_names.at( to_underlying( status ) );
}

TaskFailure TaskFailure::current()
{
  auto exception = current_exception();
  try {
    rethrow_exception( exception );
  } catch ( const std::exception& e ) {
    return { e.what(), exception };
  } catch ( ... ) {
    return { "unknown error", exception };
  }
}

Task::Task( string task_id,
            TaskKind kind,
            shared_ptr<const App> app,
            any arguments,
            optional<ResourceRequest> resources )
  : task_id_( move( task_id ) )
  , kind_( kind )
  , app_( move( app ) )
  , arguments_( move( arguments ) )
  , resources_( resources )
{
  if ( task_id_.empty() ) {
    throw invalid_argument( "task id must not be empty" );
  }
  if ( not app_ ) {
    throw invalid_argument( "task " + task_id_ + " has no app" );
  }
}

void Task::set_resources( const ResourceRequest& request )
{
  if ( resources_ ) {
    return;
  }
  resources_ = request;
}

void Task::start()
{
  CHECK( status_ == TaskStatus::Ready ) << *this << " started while " << status_;
  status_ = TaskStatus::Running;
}

void Task::finish( any value )
{
  CHECK( status_ == TaskStatus::Running ) << *this << " finished while " << status_;
  result_.emplace( in_place, move( value ) );
  status_ = TaskStatus::Finished;
}

void Task::fail( TaskFailure failure )
{
  CHECK( not terminal() ) << *this << " failed twice";
  result_.emplace( unexpect, move( failure ) );
  status_ = TaskStatus::Failed;
}

string Task::failure_message() const
{
  if ( not failed() ) {
    return {};
  }
  return result_->error().message;
}

ostream& operator<<( ostream& s, const Task& task )
{
  return s << "Task( " << task.task_id_ << " )";
}
