#pragma once

#include <cstdint>
#include <expected>
#include <system_error>
#include <type_traits>

namespace stratum::state_db {

enum class state_db_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  key_collision,
  duplicate_name,
  unknown_module,
  unknown_field,
  field_kind_mismatch,
  sub_key_too_large,
  witness_mismatch,
  invalid_proof,
  malformed_witness,
  backend_io_failure,
  read_only
};

const std::error_category& state_db_category() noexcept;

std::error_code make_error_code( state_db_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

/**
 * Errors that invalidate the whole slot, as opposed to errors that only fail
 * the operation that caused them.
 */
bool is_fatal( const std::error_code& ec ) noexcept;

} // namespace stratum::state_db

template<>
struct std::is_error_code_enum< stratum::state_db::state_db_errc >: public std::true_type
{};
