#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <system_error>
#include <vector>

#include <stratum/state_db/error.hpp>
#include <stratum/state_db/store.hpp>
#include <stratum/state_db/types.hpp>

namespace stratum::state_db {

using change_set = std::map< storage_key, std::optional< storage_value > >;

struct checkpoint
{
  std::size_t depth = 0;
  std::uint64_t id  = 0;
};

/**
 * working_set buffers the reads and writes of a slot on top of a store.
 *
 * Writes go to the top of a stack of layers. checkpoint() pushes a layer,
 * revert() drops every layer above a checkpoint and squash() folds them into
 * the layer below it. Reads see the layers top down, then a cache of values
 * already read from the store, then the store itself.
 *
 * The first fatal error returned by the store is latched in fault() so that it
 * survives a caller that ignores it.
 */
class working_set final
{
public:
  explicit working_set( store& s, bool read_only = false );
  working_set( const working_set& )            = delete;
  working_set( working_set&& )                 = delete;
  working_set& operator=( const working_set& ) = delete;
  working_set& operator=( working_set&& )      = delete;
  ~working_set()                               = default;

  result< std::optional< storage_value > > read( const storage_key& key );
  std::error_code write( const storage_key& key, storage_value value );
  std::error_code remove( const storage_key& key );

  checkpoint make_checkpoint();
  void revert( const checkpoint& cp );
  void squash( const checkpoint& cp );

  /**
   * Push every buffered write to the store and commit it. All checkpoints must
   * have been reverted or squashed.
   */
  result< digest > flush();

  /**
   * Drop every buffered write and cached read.
   */
  void clear() noexcept;

  change_set changes() const;
  std::size_t depth() const noexcept;
  bool read_only() const noexcept;
  const std::error_code& fault() const noexcept;

private:
  void check_checkpoint( const checkpoint& cp ) const;
  void latch( const std::error_code& ec ) noexcept;

  store& _store;
  std::vector< change_set > _layers;
  std::vector< std::uint64_t > _layer_ids;
  std::uint64_t _next_id = 1;
  change_set _cache;
  std::error_code _fault;
  bool _read_only;
};

} // namespace stratum::state_db
