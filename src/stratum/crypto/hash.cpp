#include <stratum/crypto/hash.hpp>
#include <stratum/memory/memory.hpp>

#include <cstdint>

#include <blake3.h>

namespace stratum::crypto {

namespace detail {

struct blake3
{
  blake3_hasher hasher{};

  blake3()
  {
    blake3_hasher_init( &hasher );
  }
};

} // namespace detail

// NOLINTBEGIN
thread_local static detail::blake3 blake3;

// NOLINTEND

void hasher_reset() noexcept
{
  blake3_hasher_reset( &blake3.hasher );
}

void hasher_update( const void* ptr, std::size_t len ) noexcept
{
  blake3_hasher_update( &blake3.hasher, ptr, len );
}

void hasher_update( std::span< const std::byte > s ) noexcept
{
  blake3_hasher_update( &blake3.hasher, s.data(), s.size() );
}

digest hasher_finalize() noexcept
{
  digest out;
  blake3_hasher_finalize( &blake3.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( const void* ptr, std::size_t len ) noexcept
{
  hasher_reset();
  hasher_update( ptr, len );
  return hasher_finalize();
}

digest hash( std::span< const std::byte > s ) noexcept
{
  return hash( s.data(), s.size() );
}

digest hash( std::string_view sv ) noexcept
{
  return hash( sv.data(), sv.size() );
}

} // namespace stratum::crypto
