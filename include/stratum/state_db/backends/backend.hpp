#pragma once

#include <stratum/state_db/backends/iterator.hpp>
#include <stratum/state_db/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>

namespace stratum::state_db::backends {

/**
 * abstract_backend is the durable medium under the committed store. Writes
 * made between start_write_batch() and end_write_batch() are applied
 * atomically: if end_write_batch() reports an error, the backend is left as it
 * was before the batch started.
 */
class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = delete;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = delete;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual iterator begin() = 0;
  virtual iterator end()   = 0;

  virtual void put( storage_key&& key, storage_value&& value )                              = 0;
  virtual std::optional< std::span< const std::byte > > get( const storage_key& key ) const = 0;
  virtual void remove( const storage_key& key )                                             = 0;
  virtual void clear()                                                                      = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t );

  const digest& merkle_root() const;
  void set_merkle_root( const digest& );

  virtual void start_write_batch()          = 0;
  virtual std::error_code end_write_batch() = 0;
  virtual void abort_write_batch()          = 0;

private:
  std::uint64_t _revision = 0;
  digest _merkle_root{};
};

} // namespace stratum::state_db::backends
