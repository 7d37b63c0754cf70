#include <stratum/crypto/sparse_merkle_tree.hpp>

#include <cstdint>

namespace stratum::crypto {

namespace {

constexpr std::byte leaf_tag{ 0x00 };
constexpr std::byte inner_tag{ 0x01 };
constexpr std::size_t bits_per_byte = 8;

bool bit_at( const tree_path& path, std::size_t index ) noexcept
{
  auto byte = std::to_integer< std::uint8_t >( path[ index / bits_per_byte ] );
  return ( byte >> ( bits_per_byte - 1 - index % bits_per_byte ) ) & 1;
}

tree_path prefix_of( const tree_path& path, std::size_t depth ) noexcept
{
  tree_path prefix{};

  auto full_bytes = depth / bits_per_byte;
  for( std::size_t i = 0; i < full_bytes; ++i )
    prefix[ i ] = path[ i ];

  if( auto remaining = depth % bits_per_byte; remaining )
  {
    auto mask            = static_cast< std::uint8_t >( 0xff << ( bits_per_byte - remaining ) );
    prefix[ full_bytes ] = path[ full_bytes ] & std::byte{ mask };
  }

  return prefix;
}

// The node at depth that shares the first depth - 1 bits with path but differs in the last one
tree_path sibling_prefix( const tree_path& path, std::size_t depth ) noexcept
{
  auto prefix = prefix_of( path, depth );
  auto index  = depth - 1;
  auto flip   = static_cast< std::uint8_t >( 1 << ( bits_per_byte - 1 - index % bits_per_byte ) );
  prefix[ index / bits_per_byte ] ^= std::byte{ flip };
  return prefix;
}

digest inner_hash( const digest& left, const digest& right ) noexcept
{
  if( left == zero_digest && right == zero_digest )
    return zero_digest;

  hasher_reset();
  hasher_update( std::span( &inner_tag, 1 ) );
  hasher_update( left );
  hasher_update( right );
  return hasher_finalize();
}

bool mask_bit( const merkle_proof& proof, std::size_t height ) noexcept
{
  return std::to_integer< std::uint8_t >( proof.mask[ height / bits_per_byte ] ) & ( 1 << ( height % bits_per_byte ) );
}

void set_mask_bit( merkle_proof& proof, std::size_t height ) noexcept
{
  proof.mask[ height / bits_per_byte ] |= std::byte{ static_cast< std::uint8_t >( 1 << ( height % bits_per_byte ) ) };
}

} // namespace

tree_path sparse_merkle_tree::path_of( std::span< const std::byte > key ) noexcept
{
  return hash( key );
}

digest sparse_merkle_tree::leaf_hash( std::span< const std::byte > key, std::span< const std::byte > value ) noexcept
{
  auto path       = path_of( key );
  auto value_hash = hash( value );

  hasher_reset();
  hasher_update( std::span( &leaf_tag, 1 ) );
  hasher_update( path );
  hasher_update( value_hash );
  return hasher_finalize();
}

std::optional< digest >
sparse_merkle_tree::compute_root( const tree_path& path, const digest& leaf, const merkle_proof& proof )
{
  auto current          = leaf;
  std::size_t sibling_i = 0;

  for( std::size_t height = 0; height < tree_depth; ++height )
  {
    auto depth     = tree_depth - height;
    digest sibling = zero_digest;

    if( mask_bit( proof, height ) )
    {
      if( sibling_i >= proof.siblings.size() )
        return {};

      sibling = proof.siblings[ sibling_i++ ];

      if( sibling == zero_digest )
        return {};
    }

    current = bit_at( path, depth - 1 ) ? inner_hash( sibling, current ) : inner_hash( current, sibling );
  }

  if( sibling_i != proof.siblings.size() )
    return {};

  return current;
}

digest sparse_merkle_tree::root() const
{
  return node( 0, tree_path{} );
}

digest sparse_merkle_tree::leaf( const tree_path& path ) const
{
  return node( tree_depth, path );
}

std::size_t sparse_merkle_tree::node_count() const noexcept
{
  return _nodes.size();
}

merkle_proof sparse_merkle_tree::prove( const tree_path& path ) const
{
  merkle_proof proof;

  for( std::size_t height = 0; height < tree_depth; ++height )
  {
    auto depth = tree_depth - height;

    if( auto sibling = node( depth, sibling_prefix( path, depth ) ); sibling != zero_digest )
    {
      set_mask_bit( proof, height );
      proof.siblings.push_back( sibling );
    }
  }

  return proof;
}

bool sparse_merkle_tree::load_proof( const tree_path& path,
                                     const digest& leaf,
                                     const merkle_proof& proof,
                                     const digest& expected_root )
{
  node_changes nodes;
  nodes[ node_id{ tree_depth, path } ] = leaf;

  auto current          = leaf;
  std::size_t sibling_i = 0;

  for( std::size_t height = 0; height < tree_depth; ++height )
  {
    auto depth     = tree_depth - height;
    digest sibling = zero_digest;

    if( mask_bit( proof, height ) )
    {
      if( sibling_i >= proof.siblings.size() )
        return false;

      sibling = proof.siblings[ sibling_i++ ];

      if( sibling == zero_digest )
        return false;
    }

    nodes[ node_id{ static_cast< std::uint16_t >( depth ), sibling_prefix( path, depth ) } ] = sibling;

    current = bit_at( path, depth - 1 ) ? inner_hash( sibling, current ) : inner_hash( current, sibling );
    nodes[ node_id{ static_cast< std::uint16_t >( depth - 1 ), prefix_of( path, depth - 1 ) } ] = current;
  }

  if( sibling_i != proof.siblings.size() || current != expected_root )
    return false;

  apply( std::move( nodes ) );
  return true;
}

staged_update sparse_merkle_tree::stage( const std::map< tree_path, digest >& leaves ) const
{
  staged_update update;
  auto& changes = update.nodes;

  auto lookup = [ & ]( std::uint16_t depth, const tree_path& prefix ) -> digest
  {
    if( auto itr = changes.find( node_id{ depth, prefix } ); itr != changes.end() )
      return itr->second;

    return node( depth, prefix );
  };

  for( const auto& [ path, leaf ]: leaves )
  {
    changes[ node_id{ tree_depth, path } ] = leaf;
    auto current                           = leaf;

    for( std::size_t depth = tree_depth; depth > 0; --depth )
    {
      auto sibling = lookup( static_cast< std::uint16_t >( depth ), sibling_prefix( path, depth ) );
      current      = bit_at( path, depth - 1 ) ? inner_hash( sibling, current ) : inner_hash( current, sibling );
      changes[ node_id{ static_cast< std::uint16_t >( depth - 1 ), prefix_of( path, depth - 1 ) } ] = current;
    }
  }

  update.root = lookup( 0, tree_path{} );
  return update;
}

void sparse_merkle_tree::apply( node_changes&& changes )
{
  for( auto& [ id, value ]: changes )
  {
    if( value == zero_digest )
      _nodes.erase( id );
    else
      _nodes.insert_or_assign( id, value );
  }
}

void sparse_merkle_tree::clear() noexcept
{
  _nodes.clear();
}

digest sparse_merkle_tree::node( std::uint16_t depth, const tree_path& prefix ) const
{
  if( auto itr = _nodes.find( node_id{ depth, prefix } ); itr != _nodes.end() )
    return itr->second;

  return zero_digest;
}

} // namespace stratum::crypto
