#include <stratum/state_db/backends/map/map_backend.hpp>

#include "map_iterator.hpp"

#include <algorithm>
#include <stdexcept>

namespace stratum::state_db::backends::map {

map_backend::map_backend():
    abstract_backend()
{}

map_backend::~map_backend() {}

iterator map_backend::begin() noexcept
{
  return iterator( std::make_unique< map_iterator >( _map.begin(), _map ) );
}

iterator map_backend::end() noexcept
{
  return iterator( std::make_unique< map_iterator >( _map.end(), _map ) );
}

void map_backend::put( storage_key&& key, storage_value&& value )
{
  record_undo( key );
  _map.insert_or_assign( std::move( key ), std::move( value ) );
}

std::optional< std::span< const std::byte > > map_backend::get( const storage_key& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void map_backend::remove( const storage_key& key )
{
  if( auto itr = _map.find( key ); itr != _map.end() )
  {
    record_undo( key );
    _map.erase( itr );
  }
}

void map_backend::clear()
{
  if( _in_batch )
    for( const auto& [ key, value ]: _map )
      _undo.try_emplace( key, value );

  _map.clear();
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

void map_backend::start_write_batch()
{
  if( _in_batch )
    throw std::runtime_error( "write batch is already in progress" );

  _in_batch          = true;
  _batch_revision    = revision();
  _batch_merkle_root = merkle_root();
}

std::error_code map_backend::end_write_batch()
{
  if( !_in_batch )
    throw std::runtime_error( "no write batch is in progress" );

  commit_write_batch();
  return {};
}

void map_backend::abort_write_batch()
{
  if( !_in_batch )
    return;

  for( auto& [ key, value ]: _undo )
  {
    if( value )
      _map.insert_or_assign( key, std::move( *value ) );
    else
      _map.erase( key );
  }

  set_revision( _batch_revision );
  set_merkle_root( _batch_merkle_root );

  _undo.clear();
  _in_batch = false;
}

bool map_backend::in_write_batch() const noexcept
{
  return _in_batch;
}

void map_backend::commit_write_batch() noexcept
{
  _undo.clear();
  _in_batch = false;
}

const map_type& map_backend::contents() const noexcept
{
  return _map;
}

void map_backend::replace_contents( map_type&& contents ) noexcept
{
  _map = std::move( contents );
}

void map_backend::record_undo( const storage_key& key )
{
  if( !_in_batch || _undo.contains( key ) )
    return;

  if( auto itr = _map.find( key ); itr != _map.end() )
    _undo.emplace( key, itr->second );
  else
    _undo.emplace( key, std::nullopt );
}

} // namespace stratum::state_db::backends::map
