#include "map_iterator.hpp"

#include <stdexcept>

namespace stratum::state_db::backends::map {

map_iterator::map_iterator( iterator_type itr, map_type& map ):
    _itr( itr ),
    _map( map )
{}

const entry_type& map_iterator::operator*() const
{
  if( !valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  return *_itr;
}

abstract_iterator& map_iterator::operator++()
{
  if( !valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  ++_itr;
  return *this;
}

abstract_iterator& map_iterator::operator--()
{
  if( _itr == _map.begin() )
    throw std::runtime_error( "iterator operation is invalid" );

  --_itr;
  return *this;
}

bool map_iterator::valid() const
{
  return _itr != _map.end();
}

std::unique_ptr< abstract_iterator > map_iterator::copy() const
{
  return std::make_unique< map_iterator >( _itr, _map );
}

} // namespace stratum::state_db::backends::map
