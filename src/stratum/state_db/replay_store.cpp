#include <stratum/state_db/replay_store.hpp>

#include <stratum/log.hpp>

#include <set>

namespace stratum::state_db {

replay_store::replay_store( witness w ):
    _witness( std::move( w ) ),
    _root( _witness.previous_root )
{}

replay_store::~replay_store() {}

result< std::optional< storage_value > > replay_store::get( const storage_key& key )
{
  if( auto itr = _overlay.find( key ); itr != _overlay.end() )
    return itr->second;

  if( auto itr = _consumed.find( key ); itr != _consumed.end() )
    return itr->second;

  if( _next_read >= _witness.reads.size() )
  {
    LOG_WARNING( log::instance(), "Witness is exhausted reading key {}", log::hex{ key.data(), key.size() } );
    return std::unexpected( state_db_errc::witness_mismatch );
  }

  const auto& entry = _witness.reads[ _next_read ];

  if( entry.key != key )
  {
    LOG_WARNING( log::instance(),
                 "Witness read {} is for key {}, expected {}",
                 _next_read,
                 log::hex{ entry.key.data(), entry.key.size() },
                 log::hex{ key.data(), key.size() } );
    return std::unexpected( state_db_errc::witness_mismatch );
  }

  ++_next_read;
  _consumed.emplace( key, entry.value );

  return entry.value;
}

void replay_store::put( const storage_key& key, const storage_value& value )
{
  _overlay.insert_or_assign( key, value );
}

void replay_store::remove( const storage_key& key )
{
  _overlay.insert_or_assign( key, std::nullopt );
}

result< digest > replay_store::commit()
{
  if( auto proven = prove_touched_keys(); !proven )
    return proven;

  if( !_overlay.empty() )
  {
    std::map< crypto::tree_path, digest > leaves;
    for( const auto& [ key, value ]: _overlay )
      leaves.insert_or_assign( crypto::sparse_merkle_tree::path_of( key ),
                               value ? crypto::sparse_merkle_tree::leaf_hash( key, *value ) : crypto::zero_digest );

    auto update = _tree.stage( leaves );
    _tree.apply( std::move( update.nodes ) );
    _root = update.root;
  }

  _overlay.clear();
  _consumed.clear();

  return _root;
}

digest replay_store::root() const
{
  return _root;
}

void replay_store::discard()
{
  _overlay.clear();
  _consumed.clear();
}

std::error_code replay_store::verify_consumed() const
{
  if( _next_read != _witness.reads.size() || _next_proof != _witness.proofs.size() )
  {
    LOG_WARNING( log::instance(),
                 "Witness has {} unconsumed reads and {} unconsumed proofs",
                 _witness.reads.size() - _next_read,
                 _witness.proofs.size() - _next_proof );
    return state_db_errc::witness_mismatch;
  }

  return {};
}

result< digest > replay_store::prove_touched_keys()
{
  std::set< storage_key > touched;
  for( const auto& [ key, value ]: _consumed )
    touched.insert( key );
  for( const auto& [ key, value ]: _overlay )
    touched.insert( key );

  for( const auto& key: touched )
  {
    if( _next_proof >= _witness.proofs.size() )
    {
      LOG_WARNING( log::instance(), "Witness is exhausted proving key {}", log::hex{ key.data(), key.size() } );
      return std::unexpected( state_db_errc::witness_mismatch );
    }

    const auto& entry = _witness.proofs[ _next_proof++ ];

    if( entry.key != key )
      return std::unexpected( state_db_errc::witness_mismatch );

    if( auto itr = _consumed.find( key ); itr != _consumed.end() && itr->second != entry.value )
      return std::unexpected( state_db_errc::witness_mismatch );

    auto path = crypto::sparse_merkle_tree::path_of( key );
    auto leaf = entry.value ? crypto::sparse_merkle_tree::leaf_hash( key, *entry.value ) : crypto::zero_digest;

    if( !_tree.load_proof( path, leaf, entry.proof, _root ) )
    {
      LOG_WARNING( log::instance(), "Proof of key {} does not verify", log::hex{ key.data(), key.size() } );
      return std::unexpected( state_db_errc::invalid_proof );
    }
  }

  return _root;
}

} // namespace stratum::state_db
