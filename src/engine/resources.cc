#include "resources.hh"

#include <stdexcept>

ResourceRequest::ResourceRequest( uint32_t cpu, uint64_t mem_mb )
  : cpu_( cpu )
  , mem_mb_( mem_mb )
{
  if ( cpu_ == 0 ) {
    throw std::invalid_argument( "a resource request needs at least one core" );
  }
}

std::ostream& operator<<( std::ostream& s, const ResourceRequest& request )
{
  s << "cpu=";
  if ( request.is_exclusive() ) {
    s << "ALL";
  } else {
    s << request.cpu();
  }
  s << " mem=" << request.mem_mb() << "MB";
  return s;
}
