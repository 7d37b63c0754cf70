#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace stratum::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

constexpr digest zero_digest = {};

/*
 * The incremental hasher is thread local. A call to hash() in between
 * hasher_reset() and hasher_finalize() resets it, so nested digests must be
 * computed before the incremental sequence starts.
 */
void hasher_reset() noexcept;
void hasher_update( const void* ptr, std::size_t len ) noexcept;
void hasher_update( std::span< const std::byte > s ) noexcept;
digest hasher_finalize() noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  if constexpr( std::endian::native != std::endian::little )
    t = std::byteswap( t );

  hasher_update( &t, sizeof( T ) );
}

digest hash( const void* ptr, std::size_t len ) noexcept;
digest hash( std::span< const std::byte > s ) noexcept;
digest hash( std::string_view sv ) noexcept;

} // namespace stratum::crypto
