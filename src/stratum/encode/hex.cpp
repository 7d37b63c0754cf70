#include <stratum/encode/hex.hpp>

#include <bit>
#include <cstdint>
#include <string_view>

namespace stratum::encode {

namespace {

constexpr std::string_view prefix   = "0x";
constexpr std::string_view alphabet = "0123456789abcdef";

} // namespace

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string out;
  out.reserve( prefix.size() + s.size() * 2 );
  out.append( prefix );

  for( const auto& b: s )
  {
    auto c = std::bit_cast< unsigned char >( b );
    out.push_back( alphabet[ c >> 4 ] );
    out.push_back( alphabet[ c & 0x0f ] );
  }

  return out;
}

} // namespace stratum::encode
