#pragma once

#include <cstdint>
#include <limits>
#include <ostream>

/**
 * An immutable request for CPU cores and memory, attached to a Task before it is admitted by an engine.
 */
class ResourceRequest
{
public:
  /// Sentinel core count meaning "every core on the machine, exclusively".
  static constexpr uint32_t CPU_ALL = std::numeric_limits<uint32_t>::max();

private:
  uint32_t cpu_ { 1 };
  uint64_t mem_mb_ {};

public:
  ResourceRequest() {}

  ResourceRequest( uint32_t cpu, uint64_t mem_mb );

  static ResourceRequest exclusive( uint64_t mem_mb ) { return { CPU_ALL, mem_mb }; }

  uint32_t cpu() const { return cpu_; }
  uint64_t mem_mb() const { return mem_mb_; }
  bool is_exclusive() const { return cpu_ == CPU_ALL; }

  bool operator==( const ResourceRequest& other ) const = default;

  friend std::ostream& operator<<( std::ostream& s, const ResourceRequest& request );
};
