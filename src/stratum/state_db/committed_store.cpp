#include <stratum/state_db/committed_store.hpp>

#include <stratum/log.hpp>

#include <stdexcept>

namespace stratum::state_db {

committed_store::committed_store() {}

committed_store::~committed_store() {}

std::error_code committed_store::open( std::shared_ptr< backends::abstract_backend > backend )
{
  if( !backend )
    throw std::runtime_error( "backend does not exist" );

  close();

  std::map< crypto::tree_path, digest > leaves;
  for( auto itr = backend->begin(); itr != backend->end(); ++itr )
    leaves.emplace( crypto::sparse_merkle_tree::path_of( itr->first ),
                    crypto::sparse_merkle_tree::leaf_hash( itr->first, itr->second ) );

  crypto::sparse_merkle_tree tree;
  auto update = tree.stage( leaves );

  if( update.root != backend->merkle_root() )
  {
    LOG_ERROR( log::instance(),
               "Backend root {} does not match its contents {}",
               log::hex{ backend->merkle_root().data(), backend->merkle_root().size() },
               log::hex{ update.root.data(), update.root.size() } );
    return state_db_errc::backend_io_failure;
  }

  tree.apply( std::move( update.nodes ) );

  _tree    = std::move( tree );
  _backend = std::move( backend );

  LOG_INFO( log::instance(),
            "Opened state at revision {} with root {}",
            _backend->revision(),
            log::hex{ _backend->merkle_root().data(), _backend->merkle_root().size() } );

  return {};
}

void committed_store::close() noexcept
{
  discard();
  _tree.clear();
  _backend.reset();
}

bool committed_store::is_open() const noexcept
{
  return static_cast< bool >( _backend );
}

result< std::optional< storage_value > > committed_store::get( const storage_key& key )
{
  check_open();

  if( auto itr = _pending.find( key ); itr != _pending.end() )
    return itr->second;

  auto value = committed_value( key );

  if( _recording && _read_keys.insert( key ).second )
    _witness.reads.emplace_back( key, value );

  return value;
}

void committed_store::put( const storage_key& key, const storage_value& value )
{
  check_open();
  _pending.insert_or_assign( key, value );
}

void committed_store::remove( const storage_key& key )
{
  check_open();
  _pending.insert_or_assign( key, std::nullopt );
}

result< digest > committed_store::commit()
{
  check_open();

  if( _pending.empty() && _read_keys.empty() )
    return _tree.root();

  const auto proof_count = _witness.proofs.size();

  if( _recording )
  {
    std::set< storage_key > touched = _read_keys;
    for( const auto& [ key, value ]: _pending )
      touched.insert( key );

    for( const auto& key: touched )
      _witness.proofs.emplace_back( key,
                                    committed_value( key ),
                                    _tree.prove( crypto::sparse_merkle_tree::path_of( key ) ) );
  }

  if( _pending.empty() )
  {
    _read_keys.clear();
    return _tree.root();
  }

  std::map< crypto::tree_path, digest > leaves;
  for( const auto& [ key, value ]: _pending )
    leaves.insert_or_assign( crypto::sparse_merkle_tree::path_of( key ),
                             value ? crypto::sparse_merkle_tree::leaf_hash( key, *value ) : crypto::zero_digest );

  auto update = _tree.stage( leaves );

  _backend->start_write_batch();

  for( const auto& [ key, value ]: _pending )
  {
    if( value )
      _backend->put( storage_key( key ), storage_value( *value ) );
    else
      _backend->remove( key );
  }

  _backend->set_revision( _backend->revision() + 1 );
  _backend->set_merkle_root( update.root );

  if( auto ec = _backend->end_write_batch(); ec )
  {
    _witness.proofs.resize( proof_count );
    LOG_ERROR( log::instance(), "Failed to commit {} writes: {}", _pending.size(), ec.message() );
    return std::unexpected( state_db_errc::backend_io_failure );
  }

  _tree.apply( std::move( update.nodes ) );

  LOG_DEBUG( log::instance(),
             "Committed {} writes at revision {}, root {}",
             _pending.size(),
             _backend->revision(),
             log::hex{ update.root.data(), update.root.size() } );

  _pending.clear();
  _read_keys.clear();

  return update.root;
}

digest committed_store::root() const
{
  check_open();
  return _tree.root();
}

void committed_store::discard()
{
  _pending.clear();
  _read_keys.clear();
  _recording = false;
  _witness   = witness{};
}

std::uint64_t committed_store::revision() const
{
  check_open();
  return _backend->revision();
}

void committed_store::begin_recording()
{
  check_open();

  if( !_pending.empty() )
    throw std::runtime_error( "cannot begin recording with uncommitted writes" );

  _read_keys.clear();
  _recording = true;
  _witness   = witness{ .previous_root = _tree.root() };
}

bool committed_store::recording() const noexcept
{
  return _recording;
}

witness committed_store::take_witness()
{
  _recording = false;
  _read_keys.clear();
  return std::exchange( _witness, witness{} );
}

void committed_store::check_open() const
{
  if( !_backend )
    throw std::runtime_error( "store is not open" );
}

std::optional< storage_value > committed_store::committed_value( const storage_key& key ) const
{
  if( auto value = _backend->get( key ); value )
    return storage_value( value->begin(), value->end() );

  return {};
}

} // namespace stratum::state_db
