#include <stratum/controller/operation.hpp>

#include <algorithm>
#include <new>
#include <sstream>
#include <stdexcept>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

namespace stratum::controller {

std::vector< std::byte > encode_operations( std::span< const operation > operations )
{
  std::stringstream ss;

  {
    const std::vector< operation > ops( operations.begin(), operations.end() );
    boost::archive::binary_oarchive oa( ss, boost::archive::no_header | boost::archive::no_tracking );
    oa << ops;
  }

  const auto view = ss.view();
  const auto data = std::as_bytes( std::span( view ) );
  return std::vector< std::byte >( data.begin(), data.end() );
}

result< std::vector< operation > > decode_operations( std::span< const std::byte > bytes )
{
  std::stringstream ss;
  ss.write( reinterpret_cast< const char* >( bytes.data() ), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
            static_cast< std::streamsize >( bytes.size() ) );

  std::vector< operation > ops;

  try
  {
    boost::archive::binary_iarchive ia( ss, boost::archive::no_header | boost::archive::no_tracking );
    ia >> ops;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( controller_errc::malformed_operations );
  }
  catch( const std::length_error& )
  {
    return std::unexpected( controller_errc::malformed_operations );
  }
  catch( const std::bad_alloc& )
  {
    return std::unexpected( controller_errc::malformed_operations );
  }

  if( ss.peek() != std::char_traits< char >::eof() )
    return std::unexpected( controller_errc::malformed_operations );

  return ops;
}

std::size_t batch_receipt::reverted_count() const noexcept
{
  return static_cast< std::size_t >( std::ranges::count( operations, true, &operation_receipt::reverted ) );
}

} // namespace stratum::controller
