#include "resource_ledger.hh"

#include <stdexcept>

#include <glog/logging.h>

using namespace std;

ResourceLedger::ResourceLedger( uint32_t total_cpu, uint64_t total_ram_mb )
  : total_cpu_( total_cpu )
  , total_ram_( total_ram_mb )
  , available_cpu_( total_cpu )
  , available_ram_( total_ram_mb )
{
  if ( total_cpu_ == 0 ) {
    throw invalid_argument( "resource ledger needs at least one core" );
  }
}

bool ResourceLedger::acquire( const ResourceRequest& request )
{
  VLOG( 1 ) << "[resources: " << *this << "] acquiring " << request;

  if ( request.mem_mb() > available_ram_ ) {
    return false;
  }

  if ( request.is_exclusive() ) {
    if ( exclusive_lock_ or available_cpu_ != total_cpu_ ) {
      return false;
    }
  } else if ( exclusive_lock_ or request.cpu() > available_cpu_ ) {
    return false;
  }

  available_ram_ -= request.mem_mb();
  if ( request.is_exclusive() ) {
    exclusive_lock_ = true;
  } else {
    available_cpu_ -= request.cpu();
  }
  return true;
}

void ResourceLedger::release( const ResourceRequest& request )
{
  VLOG( 1 ) << "[resources: " << *this << "] releasing " << request;

  CHECK_LE( request.mem_mb(), total_ram_ - available_ram_ ) << "released more memory than was acquired";
  available_ram_ += request.mem_mb();

  if ( request.is_exclusive() ) {
    CHECK( exclusive_lock_ ) << "released an exclusive request that was never acquired";
    exclusive_lock_ = false;
  } else {
    CHECK_LE( request.cpu(), total_cpu_ - available_cpu_ ) << "released more cores than were acquired";
    available_cpu_ += request.cpu();
  }
}

bool ResourceLedger::satisfiable( const ResourceRequest& request ) const
{
  if ( request.mem_mb() > total_ram_ ) {
    return false;
  }
  return request.is_exclusive() or request.cpu() <= total_cpu_;
}

ostream& operator<<( ostream& s, const ResourceLedger& ledger )
{
  s << ledger.available_cpu_ << "/" << ledger.total_cpu_;
  if ( ledger.exclusive_lock_ ) {
    s << "L";
  }
  s << ";" << ledger.available_ram_ << "/" << ledger.total_ram_;
  return s;
}
