#include <random>
#include <vector>

#include <glog/logging.h>

#include "resource_ledger.hh"

using namespace std;

static void check_bounds( const ResourceLedger& ledger )
{
  CHECK_LE( ledger.available_cpu(), ledger.total_cpu() );
  CHECK_LE( ledger.available_ram(), ledger.total_ram() );
}

static void admission()
{
  ResourceLedger ledger( 4, 1000 );

  CHECK( not ledger.acquire( { 1, 1001 } ) );
  CHECK( not ledger.acquire( { 5, 10 } ) );
  CHECK( ledger.idle() );

  CHECK( ledger.acquire( { 3, 600 } ) );
  CHECK_EQ( ledger.available_cpu(), 1u );
  CHECK_EQ( ledger.available_ram(), 400u );

  CHECK( not ledger.acquire( { 2, 100 } ) );
  CHECK( not ledger.acquire( { 1, 500 } ) );
  CHECK( ledger.acquire( { 1, 400 } ) );
  CHECK_EQ( ledger.available_cpu(), 0u );
  CHECK_EQ( ledger.available_ram(), 0u );

  ledger.release( { 3, 600 } );
  ledger.release( { 1, 400 } );
  CHECK( ledger.idle() );
}

static void exclusive()
{
  ResourceLedger ledger( 4, 1000 );

  CHECK( ledger.acquire( { 1, 0 } ) );
  CHECK( not ledger.acquire( ResourceRequest::exclusive( 0 ) ) );
  ledger.release( { 1, 0 } );

  CHECK( ledger.acquire( ResourceRequest::exclusive( 100 ) ) );
  CHECK( ledger.exclusive_lock() );
  CHECK_EQ( ledger.available_cpu(), 4u );
  CHECK_EQ( ledger.available_ram(), 900u );

  CHECK( not ledger.acquire( { 1, 0 } ) );
  CHECK( not ledger.acquire( ResourceRequest::exclusive( 0 ) ) );

  ledger.release( ResourceRequest::exclusive( 100 ) );
  CHECK( ledger.idle() );
  CHECK( ledger.acquire( { 1, 0 } ) );
}

static void satisfiable()
{
  ResourceLedger ledger( 2, 512 );
  CHECK( ledger.satisfiable( { 2, 512 } ) );
  CHECK( ledger.satisfiable( ResourceRequest::exclusive( 512 ) ) );
  CHECK( not ledger.satisfiable( { 3, 0 } ) );
  CHECK( not ledger.satisfiable( ResourceRequest::exclusive( 513 ) ) );
}

static void conservation()
{
  const uint32_t total_cpu = 8;
  const uint64_t total_ram = 4096;
  ResourceLedger ledger( total_cpu, total_ram );
  vector<ResourceRequest> held;
  mt19937 rng( 1234 );

  for ( size_t i = 0; i < 20000; i++ ) {
    if ( not held.empty() and rng() % 2 ) {
      size_t victim = rng() % held.size();
      ledger.release( held[victim] );
      held.erase( held.begin() + victim );
    } else {
      ResourceRequest request = rng() % 10 == 0 ? ResourceRequest::exclusive( rng() % 1024 )
                                                : ResourceRequest( 1 + rng() % 4, rng() % 1024 );
      bool lock_before = ledger.exclusive_lock();
      if ( ledger.acquire( request ) ) {
        CHECK( not lock_before );
        if ( request.is_exclusive() ) {
          CHECK( held.empty() ) << "exclusive request admitted next to another task";
        }
        held.push_back( request );
      }
    }

    check_bounds( ledger );

    uint64_t held_cpu = 0;
    uint64_t held_ram = 0;
    bool held_exclusive = false;
    for ( const auto& r : held ) {
      held_ram += r.mem_mb();
      if ( r.is_exclusive() ) {
        held_exclusive = true;
      } else {
        held_cpu += r.cpu();
      }
    }
    CHECK_EQ( ledger.available_cpu() + held_cpu, total_cpu );
    CHECK_EQ( ledger.available_ram() + held_ram, total_ram );
    CHECK_EQ( ledger.exclusive_lock(), held_exclusive );
    if ( held_exclusive ) {
      CHECK_EQ( held.size(), 1u );
    }
  }
}

void test( void )
{
  admission();
  exclusive();
  satisfiable();
  conservation();
}
