#include <stratum/state_db/key_schema.hpp>

#include <stratum/log.hpp>
#include <stratum/memory.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

#include <boost/endian.hpp>

namespace stratum::state_db {

namespace {

constexpr std::byte no_sub_key{ 0x00 };
constexpr std::byte has_sub_key{ 0x01 };

template< typename T >
void append_big_endian( storage_key& key, T value )
{
  boost::endian::native_to_big_inplace( value );
  std::ranges::copy( memory::as_bytes( value ), std::back_inserter( key ) );
}

} // namespace

storage_key encode_key( module_id module, field_id field )
{
  storage_key key;
  key.reserve( sizeof( module ) + sizeof( field ) + 1 );
  append_big_endian( key, module );
  append_big_endian( key, field );
  key.push_back( no_sub_key );
  return key;
}

storage_key encode_key( module_id module, field_id field, std::span< const std::byte > sub_key )
{
  if( sub_key.size() > max_sub_key_size )
    throw std::length_error( "sub key exceeds the maximum size" );

  storage_key key;
  key.reserve( sizeof( module ) + sizeof( field ) + 1 + sizeof( std::uint32_t ) + sub_key.size() );
  append_big_endian( key, module );
  append_big_endian( key, field );
  key.push_back( has_sub_key );
  append_big_endian( key, static_cast< std::uint32_t >( sub_key.size() ) );
  std::ranges::copy( sub_key, std::back_inserter( key ) );
  return key;
}

result< key_schema > key_schema::create( std::vector< module_descriptor > modules )
{
  std::set< storage_key > prefixes;
  std::set< module_id > module_ids;
  std::set< std::string_view > module_names;

  for( const auto& module: modules )
  {
    if( !module_ids.insert( module.id ).second )
    {
      LOG_ERROR( log::instance(), "Module id {} of '{}' is registered more than once", module.id, module.name );
      return std::unexpected( state_db_errc::key_collision );
    }

    if( !module_names.insert( module.name ).second )
    {
      LOG_ERROR( log::instance(), "Module name '{}' is registered more than once", module.name );
      return std::unexpected( state_db_errc::duplicate_name );
    }

    std::set< std::string_view > field_names;

    for( const auto& field: module.fields )
    {
      if( !field_names.insert( field.name ).second )
      {
        LOG_ERROR( log::instance(), "Field name '{}' is registered more than once in module '{}'", field.name, module.name );
        return std::unexpected( state_db_errc::duplicate_name );
      }

      if( !prefixes.insert( encode_key( module.id, field.id ) ).second )
      {
        LOG_ERROR( log::instance(),
                   "Field '{}' of module '{}' ({}:{}) collides with a registered field",
                   field.name,
                   module.name,
                   module.id,
                   field.id );
        return std::unexpected( state_db_errc::key_collision );
      }
    }
  }

  std::ranges::sort( modules,
                     []( const module_descriptor& lhs, const module_descriptor& rhs )
                     {
                       return lhs.id < rhs.id;
                     } );

  key_schema schema;
  schema._modules = std::move( modules );
  return schema;
}

result< storage_key > key_schema::derive_key( module_id module, field_id field ) const
{
  auto descriptor = lookup( module, field );
  if( !descriptor )
    return std::unexpected( descriptor.error() );

  if( ( *descriptor )->kind != field_kind::value )
    return std::unexpected( state_db_errc::field_kind_mismatch );

  return encode_key( module, field );
}

result< storage_key >
key_schema::derive_key( module_id module, field_id field, std::span< const std::byte > sub_key ) const
{
  auto descriptor = lookup( module, field );
  if( !descriptor )
    return std::unexpected( descriptor.error() );

  if( ( *descriptor )->kind != field_kind::map )
    return std::unexpected( state_db_errc::field_kind_mismatch );

  if( sub_key.size() > max_sub_key_size )
    return std::unexpected( state_db_errc::sub_key_too_large );

  return encode_key( module, field, sub_key );
}

result< module_id > key_schema::find_module( std::string_view name ) const
{
  auto itr = std::ranges::find( _modules, name, &module_descriptor::name );
  if( itr == _modules.end() )
    return std::unexpected( state_db_errc::unknown_module );

  return itr->id;
}

result< field_id > key_schema::find_field( module_id module, std::string_view name ) const
{
  const auto* desc = descriptor( module );
  if( !desc )
    return std::unexpected( state_db_errc::unknown_module );

  auto itr = std::ranges::find( desc->fields, name, &field_descriptor::name );
  if( itr == desc->fields.end() )
    return std::unexpected( state_db_errc::unknown_field );

  return itr->id;
}

const module_descriptor* key_schema::descriptor( module_id module ) const noexcept
{
  auto itr = std::ranges::lower_bound( _modules, module, {}, &module_descriptor::id );
  if( itr == _modules.end() || itr->id != module )
    return nullptr;

  return &*itr;
}

const std::vector< module_descriptor >& key_schema::modules() const noexcept
{
  return _modules;
}

result< const field_descriptor* > key_schema::lookup( module_id module, field_id field ) const
{
  const auto* desc = descriptor( module );
  if( !desc )
    return std::unexpected( state_db_errc::unknown_module );

  auto itr = std::ranges::find( desc->fields, field, &field_descriptor::id );
  if( itr == desc->fields.end() )
    return std::unexpected( state_db_errc::unknown_field );

  return &*itr;
}

} // namespace stratum::state_db
