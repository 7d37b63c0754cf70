#pragma once

#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <stratum/state_db/error.hpp>
#include <stratum/state_db/types.hpp>

namespace stratum::state_db {

struct field_descriptor
{
  field_id id = 0;
  std::string name;
  field_kind kind = field_kind::value;
};

struct module_descriptor
{
  module_id id = 0;
  std::string name;
  std::vector< field_descriptor > fields;
};

/**
 * Encode a storage key. The layout is
 *
 *   module id (u32 big endian) | field id (u32 big endian) | 0x00
 *   module id (u32 big endian) | field id (u32 big endian) | 0x01 | length (u32 big endian) | sub key
 *
 * which is injective over (module, field, optional sub key) and keeps the
 * keys of a module contiguous. A sub key may be at most max_sub_key_size
 * bytes, encode_key throws std::length_error otherwise.
 */
inline constexpr std::size_t max_sub_key_size = std::numeric_limits< std::uint32_t >::max();

storage_key encode_key( module_id module, field_id field );
storage_key encode_key( module_id module, field_id field, std::span< const std::byte > sub_key );

/**
 * key_schema is the validated set of module descriptors of a runtime. It is
 * immutable once created.
 */
class key_schema final
{
public:
  key_schema( const key_schema& )            = default;
  key_schema( key_schema&& )                 = default;
  key_schema& operator=( const key_schema& ) = default;
  key_schema& operator=( key_schema&& )      = default;
  ~key_schema()                              = default;

  /**
   * Validate the descriptors. Every registered field is checked against every
   * other for a colliding key prefix.
   */
  static result< key_schema > create( std::vector< module_descriptor > modules );

  result< storage_key > derive_key( module_id module, field_id field ) const;
  result< storage_key > derive_key( module_id module, field_id field, std::span< const std::byte > sub_key ) const;

  result< module_id > find_module( std::string_view name ) const;
  result< field_id > find_field( module_id module, std::string_view name ) const;

  const module_descriptor* descriptor( module_id module ) const noexcept;
  const std::vector< module_descriptor >& modules() const noexcept;

private:
  key_schema() = default;

  result< const field_descriptor* > lookup( module_id module, field_id field ) const;

  std::vector< module_descriptor > _modules;
};

} // namespace stratum::state_db
