#include <stratum/state_db/backends/iterator.hpp>

#include <algorithm>

namespace stratum::state_db::backends {

iterator::iterator( std::unique_ptr< abstract_iterator > itr ):
    _itr( std::move( itr ) )
{}

iterator::iterator( const iterator& other ):
    _itr( other._itr ? other._itr->copy() : nullptr )
{}

iterator::iterator( iterator&& other ) noexcept:
    _itr( std::move( other._itr ) )
{}

const entry_type& iterator::operator*() const
{
  return **_itr;
}

const entry_type* iterator::operator->() const
{
  return &**_itr;
}

iterator& iterator::operator++()
{
  ++( *_itr );
  return *this;
}

iterator& iterator::operator--()
{
  --( *_itr );
  return *this;
}

iterator& iterator::operator=( const iterator& other )
{
  if( this != &other )
    _itr = other._itr ? other._itr->copy() : nullptr;

  return *this;
}

iterator& iterator::operator=( iterator&& other ) noexcept
{
  _itr = std::move( other._itr );
  return *this;
}

bool iterator::valid() const
{
  return _itr && _itr->valid();
}

bool operator==( const iterator& x, const iterator& y )
{
  if( x.valid() && y.valid() )
    return std::ranges::equal( x->first, y->first );

  return x.valid() == y.valid();
}

} // namespace stratum::state_db::backends
