#pragma once

#include <optional>
#include <span>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/vector.hpp>

#include <stratum/crypto/sparse_merkle_tree.hpp>
#include <stratum/state_db/error.hpp>
#include <stratum/state_db/types.hpp>

namespace stratum::state_db {

namespace detail {

template< class Archive >
void save_optional( Archive& ar, const std::optional< storage_value >& value )
{
  const bool present = value.has_value();
  ar << present;

  if( present )
    ar << *value;
}

template< class Archive >
void load_optional( Archive& ar, std::optional< storage_value >& value )
{
  bool present = false;
  ar >> present;

  if( present )
  {
    storage_value v;
    ar >> v;
    value = std::move( v );
  }
  else
    value.reset();
}

} // namespace detail

/**
 * A read served by the committed store. An empty value records that the key
 * was absent.
 */
struct witness_entry
{
  storage_key key;
  std::optional< storage_value > value;

  bool operator==( const witness_entry& ) const = default;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    ar << key;
    detail::save_optional( ar, value );
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    ar >> key;
    detail::load_optional( ar, value );
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

/**
 * The committed value of a key touched in a commit round together with its
 * proof against the root before the round was committed.
 */
struct proof_entry
{
  storage_key key;
  std::optional< storage_value > value;
  crypto::merkle_proof proof;

  bool operator==( const proof_entry& ) const = default;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    ar << key;
    detail::save_optional( ar, value );
    ar << proof;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    ar >> key;
    detail::load_optional( ar, value );
    ar >> proof;
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

/**
 * Everything a replay store needs to re-execute a slot: the root the slot
 * started from, every read in first read order and, for every commit round,
 * the proofs of the touched keys in ascending key order.
 */
struct witness
{
  digest previous_root{};
  std::vector< witness_entry > reads;
  std::vector< proof_entry > proofs;

  bool operator==( const witness& ) const = default;

  std::vector< std::byte > to_bytes() const;
  static result< witness > from_bytes( std::span< const std::byte > bytes );

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & previous_root;
    ar & reads;
    ar & proofs;
  }
};

} // namespace stratum::state_db
