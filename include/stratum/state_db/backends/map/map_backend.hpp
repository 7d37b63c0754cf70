#pragma once

#include <stratum/state_db/backends/backend.hpp>
#include <stratum/state_db/backends/map/types.hpp>

namespace stratum::state_db::backends::map {

/**
 * In memory backend. Write batches keep an undo log so that an aborted batch
 * restores the previous contents and metadata.
 */
class map_backend: public abstract_backend
{
public:
  map_backend();
  map_backend( const map_backend& )            = delete;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = delete;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() override;

  iterator begin() noexcept override;
  iterator end() noexcept override;

  void put( storage_key&& key, storage_value&& value ) override;
  std::optional< std::span< const std::byte > > get( const storage_key& key ) const override;
  void remove( const storage_key& key ) override;
  void clear() override;

  std::uint64_t size() const noexcept override;

  void start_write_batch() override;
  std::error_code end_write_batch() override;
  void abort_write_batch() override;

protected:
  bool in_write_batch() const noexcept;
  void commit_write_batch() noexcept;
  const map_type& contents() const noexcept;
  void replace_contents( map_type&& contents ) noexcept;

private:
  void record_undo( const storage_key& key );

  map_type _map;
  undo_log_type _undo;
  bool _in_batch = false;
  std::uint64_t _batch_revision = 0;
  digest _batch_merkle_root{};
};

} // namespace stratum::state_db::backends::map
