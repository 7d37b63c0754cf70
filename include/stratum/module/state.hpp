#pragma once

#include <optional>
#include <system_error>

#include <stratum/module/codec.hpp>
#include <stratum/module/module.hpp>

namespace stratum::module {

/**
 * Typed access to a value field of a module.
 */
template< typename T >
class state_value final
{
public:
  state_value( state_db::module_id module, state_db::field_id field ) noexcept:
      _module( module ),
      _field( field )
  {}

  result< std::optional< T > > get( context& ctx ) const
  {
    auto key = ctx.schema().derive_key( _module, _field );
    if( !key )
      return std::unexpected( key.error() );

    auto bytes = ctx.state().read( *key );
    if( !bytes )
      return std::unexpected( bytes.error() );

    if( !bytes->has_value() )
      return std::optional< T >{};

    auto value = codec< T >::decode( **bytes );
    if( !value )
      return std::unexpected( value.error() );

    return std::optional< T >( std::move( *value ) );
  }

  result< T > get_or( context& ctx, T default_value ) const
  {
    auto value = get( ctx );
    if( !value )
      return std::unexpected( value.error() );

    return value->value_or( std::move( default_value ) );
  }

  std::error_code set( context& ctx, const T& value ) const
  {
    auto key = ctx.schema().derive_key( _module, _field );
    if( !key )
      return key.error();

    return ctx.state().write( *key, codec< T >::encode( value ) );
  }

  std::error_code remove( context& ctx ) const
  {
    auto key = ctx.schema().derive_key( _module, _field );
    if( !key )
      return key.error();

    return ctx.state().remove( *key );
  }

private:
  state_db::module_id _module;
  state_db::field_id _field;
};

/**
 * Typed access to a map field of a module. The encoded key is the sub key of
 * the entry.
 */
template< typename K, typename V >
class state_map final
{
public:
  state_map( state_db::module_id module, state_db::field_id field ) noexcept:
      _module( module ),
      _field( field )
  {}

  result< std::optional< V > > get( context& ctx, const K& k ) const
  {
    auto key = derive( ctx, k );
    if( !key )
      return std::unexpected( key.error() );

    auto bytes = ctx.state().read( *key );
    if( !bytes )
      return std::unexpected( bytes.error() );

    if( !bytes->has_value() )
      return std::optional< V >{};

    auto value = codec< V >::decode( **bytes );
    if( !value )
      return std::unexpected( value.error() );

    return std::optional< V >( std::move( *value ) );
  }

  result< V > get_or( context& ctx, const K& k, V default_value ) const
  {
    auto value = get( ctx, k );
    if( !value )
      return std::unexpected( value.error() );

    return value->value_or( std::move( default_value ) );
  }

  std::error_code set( context& ctx, const K& k, const V& value ) const
  {
    auto key = derive( ctx, k );
    if( !key )
      return key.error();

    return ctx.state().write( *key, codec< V >::encode( value ) );
  }

  std::error_code remove( context& ctx, const K& k ) const
  {
    auto key = derive( ctx, k );
    if( !key )
      return key.error();

    return ctx.state().remove( *key );
  }

private:
  result< state_db::storage_key > derive( context& ctx, const K& k ) const
  {
    auto sub_key = codec< K >::encode( k );
    return ctx.schema().derive_key( _module, _field, sub_key );
  }

  state_db::module_id _module;
  state_db::field_id _field;
};

} // namespace stratum::module
