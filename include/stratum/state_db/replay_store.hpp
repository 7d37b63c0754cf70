#pragma once

#include <map>
#include <optional>
#include <system_error>

#include <stratum/crypto/sparse_merkle_tree.hpp>
#include <stratum/state_db/store.hpp>
#include <stratum/state_db/witness.hpp>

namespace stratum::state_db {

/**
 * replay_store re-executes a slot from its witness alone. Reads are served by
 * consuming the recorded reads in order, writes only touch an overlay, and
 * commit proves the touched keys against the current root before computing
 * the next root on a partial tree.
 */
class replay_store final: public store
{
public:
  explicit replay_store( witness w );
  replay_store( const replay_store& )            = delete;
  replay_store( replay_store&& )                 = delete;
  replay_store& operator=( const replay_store& ) = delete;
  replay_store& operator=( replay_store&& )      = delete;
  ~replay_store() final;

  result< std::optional< storage_value > > get( const storage_key& key ) final;
  void put( const storage_key& key, const storage_value& value ) final;
  void remove( const storage_key& key ) final;
  result< digest > commit() final;
  digest root() const final;
  void discard() final;

  /**
   * Fails with witness_mismatch if any read or proof of the witness has not
   * been consumed.
   */
  std::error_code verify_consumed() const;

private:
  result< digest > prove_touched_keys();

  witness _witness;
  std::size_t _next_read  = 0;
  std::size_t _next_proof = 0;
  digest _root{};
  crypto::sparse_merkle_tree _tree;
  std::map< storage_key, std::optional< storage_value > > _overlay;
  std::map< storage_key, std::optional< storage_value > > _consumed;
};

} // namespace stratum::state_db
