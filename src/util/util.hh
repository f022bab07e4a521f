#pragma once

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

template<typename T>
constexpr auto to_underlying( T t ) noexcept
{
  return static_cast<std::underlying_type_t<T>>( t );
}

/**
 * Reads an unsigned integer from the environment.
 *
 * @param name  The variable to read.
 * @return      The value, or std::nullopt if the variable is unset or empty.
 * @throws std::invalid_argument if the variable is set but is not a base-10 unsigned integer.
 */
inline std::optional<uint64_t> env_u64( const char* name )
{
  const char* raw = std::getenv( name );
  if ( raw == nullptr or *raw == '\0' ) {
    return {};
  }

  std::string_view text( raw );
  uint64_t value {};
  auto [end, ec] = std::from_chars( text.data(), text.data() + text.size(), value );
  if ( ec != std::errc() or end != text.data() + text.size() ) {
    throw std::invalid_argument( std::string( name ) + ": expected an unsigned integer, got \"" + raw + "\"" );
  }
  return value;
}
