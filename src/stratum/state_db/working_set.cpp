#include <stratum/state_db/working_set.hpp>

#include <stdexcept>

namespace stratum::state_db {

working_set::working_set( store& s, bool read_only ):
    _store( s ),
    _layers( 1 ),
    _layer_ids( 1, 0 ),
    _read_only( read_only )
{}

result< std::optional< storage_value > > working_set::read( const storage_key& key )
{
  if( _fault )
    return std::unexpected( _fault );

  for( auto layer = _layers.rbegin(); layer != _layers.rend(); ++layer )
    if( auto itr = layer->find( key ); itr != layer->end() )
      return itr->second;

  if( auto itr = _cache.find( key ); itr != _cache.end() )
    return itr->second;

  auto value = _store.get( key );
  if( !value )
  {
    latch( value.error() );
    return value;
  }

  _cache.emplace( key, *value );
  return value;
}

std::error_code working_set::write( const storage_key& key, storage_value value )
{
  if( _read_only )
    return state_db_errc::read_only;

  _layers.back().insert_or_assign( key, std::move( value ) );
  return {};
}

std::error_code working_set::remove( const storage_key& key )
{
  if( _read_only )
    return state_db_errc::read_only;

  _layers.back().insert_or_assign( key, std::nullopt );
  return {};
}

checkpoint working_set::make_checkpoint()
{
  checkpoint cp{ .depth = _layers.size(), .id = _next_id++ };
  _layers.emplace_back();
  _layer_ids.push_back( cp.id );
  return cp;
}

void working_set::revert( const checkpoint& cp )
{
  check_checkpoint( cp );

  _layers.resize( cp.depth );
  _layer_ids.resize( cp.depth );
}

void working_set::squash( const checkpoint& cp )
{
  check_checkpoint( cp );

  auto& target = _layers[ cp.depth - 1 ];
  for( auto layer = _layers.begin() + static_cast< std::ptrdiff_t >( cp.depth ); layer != _layers.end(); ++layer )
    for( auto& [ key, value ]: *layer )
      target.insert_or_assign( key, std::move( value ) );

  _layers.resize( cp.depth );
  _layer_ids.resize( cp.depth );
}

result< digest > working_set::flush()
{
  if( _read_only )
    return std::unexpected( state_db_errc::read_only );

  if( _layers.size() != 1 )
    throw std::logic_error( "cannot flush a working set with open checkpoints" );

  if( _fault )
    return std::unexpected( _fault );

  for( const auto& [ key, value ]: _layers.front() )
  {
    if( value )
      _store.put( key, *value );
    else
      _store.remove( key );
  }

  auto root = _store.commit();
  if( !root )
  {
    latch( root.error() );
    return root;
  }

  clear();
  return root;
}

void working_set::clear() noexcept
{
  _layers.resize( 1 );
  _layer_ids.resize( 1 );
  _layers.front().clear();
  _cache.clear();
}

change_set working_set::changes() const
{
  change_set flattened;

  for( const auto& layer: _layers )
    for( const auto& [ key, value ]: layer )
      flattened.insert_or_assign( key, value );

  return flattened;
}

std::size_t working_set::depth() const noexcept
{
  return _layers.size() - 1;
}

bool working_set::read_only() const noexcept
{
  return _read_only;
}

const std::error_code& working_set::fault() const noexcept
{
  return _fault;
}

void working_set::check_checkpoint( const checkpoint& cp ) const
{
  if( cp.depth == 0 || cp.depth >= _layers.size() || _layer_ids[ cp.depth ] != cp.id )
    throw std::logic_error( "checkpoint is no longer valid" );
}

void working_set::latch( const std::error_code& ec ) noexcept
{
  if( !_fault && is_fatal( ec ) )
    _fault = ec;
}

} // namespace stratum::state_db
