#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/vector.hpp>

#include <stratum/crypto/hash.hpp>

namespace stratum::crypto {

constexpr std::size_t tree_depth = 256;

using tree_path = digest;

struct node_id
{
  std::uint16_t depth = 0;
  tree_path prefix{};

  auto operator<=>( const node_id& ) const = default;
};

/**
 * A compressed inclusion (or exclusion) proof. Bit i of the mask is set when
 * the sibling at height i (0 being the leaf level) is non-empty, in which case
 * it is the next element of siblings.
 */
struct merkle_proof
{
  std::array< std::byte, tree_depth / 8 > mask{};
  std::vector< digest > siblings;

  bool operator==( const merkle_proof& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & mask;
    ar & siblings;
  }
};

using node_changes = std::map< node_id, digest >;

struct staged_update
{
  node_changes nodes;
  digest root{};
};

/**
 * sparse_merkle_tree commits to a key-value map with a binary tree of fixed
 * depth, indexed by the hash of the key. Empty subtrees hash to the zero
 * digest and are not stored, so the tree only keeps the nodes on the paths of
 * present leaves.
 *
 * The same structure serves as a full tree (every leaf inserted) and as a
 * partial tree (only the paths loaded from proofs). Updates on a partial tree
 * are correct as long as the proof of every updated path has been loaded.
 */
class sparse_merkle_tree final
{
public:
  sparse_merkle_tree()                                        = default;
  sparse_merkle_tree( const sparse_merkle_tree& )             = default;
  sparse_merkle_tree( sparse_merkle_tree&& )                  = default;
  sparse_merkle_tree& operator=( const sparse_merkle_tree& ) = default;
  sparse_merkle_tree& operator=( sparse_merkle_tree&& )      = default;
  ~sparse_merkle_tree()                                       = default;

  static tree_path path_of( std::span< const std::byte > key ) noexcept;
  static digest leaf_hash( std::span< const std::byte > key, std::span< const std::byte > value ) noexcept;

  /**
   * Fold a leaf up its path using the proof. Returns an empty optional if the
   * proof is malformed.
   */
  static std::optional< digest > compute_root( const tree_path& path, const digest& leaf, const merkle_proof& proof );

  digest root() const;
  digest leaf( const tree_path& path ) const;
  std::size_t node_count() const noexcept;

  merkle_proof prove( const tree_path& path ) const;

  /**
   * Verify the proof against expected_root and, on success, remember every
   * node on the path so that the path can later be updated.
   */
  bool load_proof( const tree_path& path, const digest& leaf, const merkle_proof& proof, const digest& expected_root );

  /**
   * Compute the nodes changed by setting each path to its leaf hash, without
   * modifying the tree. A zero leaf removes the entry.
   */
  staged_update stage( const std::map< tree_path, digest >& leaves ) const;
  void apply( node_changes&& changes );

  void clear() noexcept;

private:
  digest node( std::uint16_t depth, const tree_path& prefix ) const;

  std::map< node_id, digest > _nodes;
};

} // namespace stratum::crypto
