#pragma once

#include <cstdint>
#include <ostream>

#include "resources.hh"

/**
 * Bookkeeping of the CPU cores and memory available to a ConcurrentEngine. Requests are admitted only when they
 * fit; a CPU_ALL request is admitted only when the machine is otherwise idle and then locks out every other task
 * until it is released.
 *
 * There is no queueing, priority or reservation: a request which does not fit is simply refused, and the caller
 * retries later.
 *
 * This class is not thread-safe.
 */
class ResourceLedger
{
  uint32_t total_cpu_;
  uint64_t total_ram_;
  uint32_t available_cpu_;
  uint64_t available_ram_;
  bool exclusive_lock_ {};

public:
  ResourceLedger( uint32_t total_cpu, uint64_t total_ram_mb );

  /**
   * Attempts to take @p request out of the ledger.
   *
   * @return  Whether the request was admitted. A refused request leaves the ledger untouched.
   */
  bool acquire( const ResourceRequest& request );

  /// Gives back a request previously admitted by acquire().
  void release( const ResourceRequest& request );

  /// Whether @p request could ever be admitted, even on an idle machine.
  bool satisfiable( const ResourceRequest& request ) const;

  uint32_t total_cpu() const { return total_cpu_; }
  uint64_t total_ram() const { return total_ram_; }
  uint32_t available_cpu() const { return available_cpu_; }
  uint64_t available_ram() const { return available_ram_; }
  bool exclusive_lock() const { return exclusive_lock_; }

  bool idle() const
  {
    return not exclusive_lock_ and available_cpu_ == total_cpu_ and available_ram_ == total_ram_;
  }

  friend std::ostream& operator<<( std::ostream& s, const ResourceLedger& ledger );
};
