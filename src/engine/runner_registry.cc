#include "runner_registry.hh"

#include <sstream>

#include <glog/logging.h>

#include "overload.hh"

using namespace std;

namespace {
template<typename... Keys>
string describe( const Keys&... keys )
{
  ostringstream out;
  out << "no runner registered for";
  ( ( out << " " << keys ), ... );
  return out.str();
}
}

UnknownRunner::UnknownRunner( TaskKind kind )
  : runtime_error( describe( kind ) )
{}

UnknownRunner::UnknownRunner( TaskKind kind, AppType type )
  : runtime_error( describe( kind, type ) )
{}

RunnerRegistry& RunnerRegistry::add( TaskKind kind, RunnerFactory factory )
{
  CHECK( factory ) << "empty runner factory for " << kind;
  entries_.insert_or_assign( kind, move( factory ) );
  return *this;
}

RunnerRegistry& RunnerRegistry::add( TaskKind kind, AppType type, RunnerFactory factory )
{
  CHECK( factory ) << "empty runner factory for " << kind << "/" << type;
  auto it = entries_.find( kind );
  if ( it == entries_.end() or not holds_alternative<ByAppType>( it->second ) ) {
    it = entries_.insert_or_assign( kind, ByAppType {} ).first;
  }
  get<ByAppType>( it->second ).insert_or_assign( type, move( factory ) );
  return *this;
}

const RunnerFactory* RunnerRegistry::lookup( TaskKind kind, AppType type ) const
{
  auto it = entries_.find( kind );
  if ( it == entries_.end() ) {
    return nullptr;
  }

  return visit( overload { []( const RunnerFactory& factory ) -> const RunnerFactory* { return &factory; },
                           [&]( const ByAppType& by_type ) -> const RunnerFactory* {
                             auto found = by_type.find( type );
                             return found == by_type.end() ? nullptr : &found->second;
                           } },
                it->second );
}

unique_ptr<Runner> RunnerRegistry::make( const Task& task ) const
{
  auto factory = lookup( task.kind(), task.app().type );
  if ( factory == nullptr ) {
    if ( entries_.contains( task.kind() ) ) {
      throw UnknownRunner( task.kind(), task.app().type );
    }
    throw UnknownRunner( task.kind() );
  }

  VLOG( 2 ) << "runner for " << task << ": " << task.kind() << "/" << task.app().type;
  return ( *factory )( task );
}
