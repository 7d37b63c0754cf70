#pragma once

#include <stratum/state_db/backends/iterator.hpp>
#include <stratum/state_db/backends/map/types.hpp>

namespace stratum::state_db::backends::map {

class map_iterator final: public abstract_iterator
{
public:
  map_iterator( const map_iterator& )            = delete;
  map_iterator( map_iterator&& )                 = delete;
  map_iterator& operator=( const map_iterator& ) = delete;
  map_iterator& operator=( map_iterator&& )      = delete;
  map_iterator( iterator_type itr, map_type& map );
  ~map_iterator() final = default;

  const entry_type& operator*() const override;

  abstract_iterator& operator++() override;
  abstract_iterator& operator--() override;

private:
  bool valid() const override;
  std::unique_ptr< abstract_iterator > copy() const override;

  iterator_type _itr;
  map_type& _map;
};

} // namespace stratum::state_db::backends::map
