#include <stratum/state_db/backends/file/file_backend.hpp>

#include <stratum/log.hpp>
#include <stratum/state_db/error.hpp>

#include <fstream>
#include <stdexcept>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/vector.hpp>

namespace stratum::state_db::backends::file {

file_backend::file_backend():
    map::map_backend()
{}

file_backend::~file_backend() {}

std::error_code file_backend::open( const std::filesystem::path& path )
{
  if( in_write_batch() )
    throw std::runtime_error( "cannot open a backend during a write batch" );

  _path = path;

  std::error_code ec;
  if( !std::filesystem::exists( _path, ec ) )
  {
    if( ec )
    {
      LOG_ERROR( log::instance(), "Unable to access snapshot {}: {}", _path.string(), ec.message() );
      return state_db_errc::backend_io_failure;
    }

    replace_contents( {} );
    set_revision( 0 );
    set_merkle_root( empty_root );
    return {};
  }

  std::ifstream in( _path, std::ios::binary );
  if( !in )
  {
    LOG_ERROR( log::instance(), "Unable to read snapshot {}", _path.string() );
    return state_db_errc::backend_io_failure;
  }

  std::uint64_t revision = 0;
  digest merkle_root{};
  map::map_type contents;

  try
  {
    boost::archive::binary_iarchive ia( in, boost::archive::no_header );
    ia >> revision;
    ia >> merkle_root;
    ia >> contents;
  }
  catch( const boost::archive::archive_exception& e )
  {
    LOG_ERROR( log::instance(), "Snapshot {} is corrupt: {}", _path.string(), e.what() );
    return state_db_errc::backend_io_failure;
  }

  replace_contents( std::move( contents ) );
  set_revision( revision );
  set_merkle_root( merkle_root );

  LOG_DEBUG( log::instance(), "Opened snapshot {} at revision {}", _path.string(), revision );

  return {};
}

const std::filesystem::path& file_backend::path() const noexcept
{
  return _path;
}

std::error_code file_backend::end_write_batch()
{
  if( !in_write_batch() )
    throw std::runtime_error( "no write batch is in progress" );

  if( _path.empty() )
    throw std::runtime_error( "backend is not open" );

  if( auto ec = write_snapshot(); ec )
  {
    abort_write_batch();
    return ec;
  }

  commit_write_batch();
  return {};
}

std::error_code file_backend::write_snapshot() const
{
  auto temp_path = _path;
  temp_path += ".tmp";

  {
    std::ofstream out( temp_path, std::ios::binary | std::ios::trunc );
    if( !out )
    {
      LOG_ERROR( log::instance(), "Unable to create snapshot {}", temp_path.string() );
      return state_db_errc::backend_io_failure;
    }

    const auto snapshot_revision = revision();
    const auto& snapshot_root    = merkle_root();

    try
    {
      boost::archive::binary_oarchive oa( out, boost::archive::no_header );
      oa << snapshot_revision;
      oa << snapshot_root;
      oa << contents();
    }
    catch( const boost::archive::archive_exception& e )
    {
      LOG_ERROR( log::instance(), "Unable to write snapshot {}: {}", temp_path.string(), e.what() );
      return state_db_errc::backend_io_failure;
    }

    out.flush();
    if( !out )
    {
      LOG_ERROR( log::instance(), "Unable to write snapshot {}", temp_path.string() );
      return state_db_errc::backend_io_failure;
    }
  }

  std::error_code ec;
  std::filesystem::rename( temp_path, _path, ec );
  if( ec )
  {
    LOG_ERROR( log::instance(), "Unable to replace snapshot {}: {}", _path.string(), ec.message() );
    std::filesystem::remove( temp_path, ec );
    return state_db_errc::backend_io_failure;
  }

  return {};
}

} // namespace stratum::state_db::backends::file
