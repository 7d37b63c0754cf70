#include <stratum/state_db/witness.hpp>

#include <new>
#include <sstream>
#include <stdexcept>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <stratum/log.hpp>

namespace stratum::state_db {

std::vector< std::byte > witness::to_bytes() const
{
  std::stringstream ss;

  {
    boost::archive::binary_oarchive oa( ss, boost::archive::no_header | boost::archive::no_tracking );
    oa << *this;
  }

  const auto view = ss.view();
  const auto data = std::as_bytes( std::span( view ) );
  return std::vector< std::byte >( data.begin(), data.end() );
}

result< witness > witness::from_bytes( std::span< const std::byte > bytes )
{
  std::stringstream ss;
  ss.write( reinterpret_cast< const char* >( bytes.data() ), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
            static_cast< std::streamsize >( bytes.size() ) );

  witness w;

  try
  {
    boost::archive::binary_iarchive ia( ss, boost::archive::no_header | boost::archive::no_tracking );
    ia >> w;
  }
  catch( const boost::archive::archive_exception& e )
  {
    LOG_WARNING( log::instance(), "Malformed witness: {}", e.what() );
    return std::unexpected( state_db_errc::malformed_witness );
  }
  catch( const std::length_error& e )
  {
    LOG_WARNING( log::instance(), "Malformed witness: {}", e.what() );
    return std::unexpected( state_db_errc::malformed_witness );
  }
  catch( const std::bad_alloc& e )
  {
    LOG_WARNING( log::instance(), "Malformed witness: {}", e.what() );
    return std::unexpected( state_db_errc::malformed_witness );
  }

  if( ss.peek() != std::char_traits< char >::eof() )
    return std::unexpected( state_db_errc::malformed_witness );

  return w;
}

} // namespace stratum::state_db
