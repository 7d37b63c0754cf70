#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <system_error>
#include <utility>

#include <stratum/crypto/sparse_merkle_tree.hpp>
#include <stratum/state_db/backends/backend.hpp>
#include <stratum/state_db/store.hpp>
#include <stratum/state_db/witness.hpp>

namespace stratum::state_db {

/**
 * committed_store is the native store. It owns the sparse Merkle tree over the
 * full contents of a backend and buffers writes until commit.
 *
 * While recording, the store captures a witness of the slot: the first read
 * of every key in a commit round is appended in read order and, at commit, a
 * proof of every key read or written in the round is appended in ascending key
 * order, against the root the round started from.
 */
class committed_store final: public store
{
public:
  committed_store();
  committed_store( const committed_store& )            = delete;
  committed_store( committed_store&& )                 = delete;
  committed_store& operator=( const committed_store& ) = delete;
  committed_store& operator=( committed_store&& )      = delete;
  ~committed_store() final;

  /**
   * Open the store over a backend. The tree is rebuilt from the contents of the
   * backend and checked against the root stored in its metadata.
   */
  std::error_code open( std::shared_ptr< backends::abstract_backend > backend );
  void close() noexcept;
  bool is_open() const noexcept;

  result< std::optional< storage_value > > get( const storage_key& key ) final;
  void put( const storage_key& key, const storage_value& value ) final;
  void remove( const storage_key& key ) final;
  result< digest > commit() final;
  digest root() const final;
  void discard() final;

  std::uint64_t revision() const;

  void begin_recording();
  bool recording() const noexcept;

  /**
   * Stop recording and return the witness captured since begin_recording().
   */
  witness take_witness();

private:
  void check_open() const;
  std::optional< storage_value > committed_value( const storage_key& key ) const;

  std::shared_ptr< backends::abstract_backend > _backend;
  crypto::sparse_merkle_tree _tree;
  std::map< storage_key, std::optional< storage_value > > _pending;
  std::set< storage_key > _read_keys;
  bool _recording = false;
  witness _witness;
};

} // namespace stratum::state_db
