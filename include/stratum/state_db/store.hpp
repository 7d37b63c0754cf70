#pragma once

#include <optional>

#include <stratum/state_db/error.hpp>
#include <stratum/state_db/types.hpp>

namespace stratum::state_db {

/**
 * store is the state a working set reads from and flushes to. It is either
 * backed by the full key-value state (committed_store) or reconstructed from a
 * witness (replay_store). Both must produce the same results and roots for the
 * same sequence of calls.
 *
 * Writes are buffered until commit(). An absent value means the key does not
 * exist.
 */
class store
{
public:
  store()                          = default;
  store( const store& )            = delete;
  store( store&& )                 = delete;
  store& operator=( const store& ) = delete;
  store& operator=( store&& )      = delete;
  virtual ~store()                 = default;

  virtual result< std::optional< storage_value > > get( const storage_key& key ) = 0;
  virtual void put( const storage_key& key, const storage_value& value )         = 0;
  virtual void remove( const storage_key& key )                                  = 0;

  /**
   * Apply every buffered write and return the new root.
   */
  virtual result< digest > commit() = 0;

  virtual digest root() const = 0;

  /**
   * Drop every buffered write along with anything recorded for a witness.
   */
  virtual void discard() = 0;
};

} // namespace stratum::state_db
