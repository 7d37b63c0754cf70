#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/endian.hpp>

#include <stratum/memory.hpp>
#include <stratum/module/error.hpp>
#include <stratum/state_db/types.hpp>

namespace stratum::module {

/**
 * codec< T > converts a value to and from the bytes kept in state. Integers
 * are fixed width little endian, byte sequences and strings are kept as is.
 */
template< typename T >
struct codec;

template< typename T >
  requires std::is_integral_v< T >
struct codec< T >
{
  static state_db::storage_value encode( T value )
  {
    boost::endian::native_to_little_inplace( value );
    auto bytes = memory::as_bytes( value );
    return state_db::storage_value( bytes.begin(), bytes.end() );
  }

  static result< T > decode( std::span< const std::byte > bytes )
  {
    if( bytes.size() != sizeof( T ) )
      return std::unexpected( module_errc::codec_failure );

    auto value = memory::bit_cast< T >( bytes );
    boost::endian::little_to_native_inplace( value );
    return value;
  }
};

template< std::size_t N >
struct codec< std::array< std::byte, N > >
{
  static state_db::storage_value encode( const std::array< std::byte, N >& value )
  {
    return state_db::storage_value( value.begin(), value.end() );
  }

  static result< std::array< std::byte, N > > decode( std::span< const std::byte > bytes )
  {
    if( bytes.size() != N )
      return std::unexpected( module_errc::codec_failure );

    std::array< std::byte, N > value;
    std::ranges::copy( bytes, value.begin() );
    return value;
  }
};

template<>
struct codec< std::vector< std::byte > >
{
  static state_db::storage_value encode( const std::vector< std::byte >& value )
  {
    return value;
  }

  static result< std::vector< std::byte > > decode( std::span< const std::byte > bytes )
  {
    return std::vector< std::byte >( bytes.begin(), bytes.end() );
  }
};

template<>
struct codec< std::string >
{
  static state_db::storage_value encode( const std::string& value )
  {
    auto bytes = memory::as_bytes( value );
    return state_db::storage_value( bytes.begin(), bytes.end() );
  }

  static result< std::string > decode( std::span< const std::byte > bytes )
  {
    return std::string( memory::pointer_cast< const char* >( bytes.data() ), bytes.size() );
  }
};

/**
 * Sequential reader over the input of a module call. Reading past the end of
 * the input fails with invalid_argument.
 */
class input_reader final
{
public:
  explicit input_reader( std::span< const std::byte > input ) noexcept;

  std::error_code read( std::span< std::byte > bytes ) noexcept;

  template< typename T >
    requires std::is_integral_v< T >
  std::error_code read( T& t ) noexcept
  {
    if( auto ec = read( memory::as_writable_bytes( t ) ); ec )
      return ec;

    boost::endian::little_to_native_inplace( t );
    return {};
  }

  std::span< const std::byte > remaining() const noexcept;
  bool empty() const noexcept;

private:
  std::span< const std::byte > _input;
};

} // namespace stratum::module
