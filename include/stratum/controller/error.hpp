#pragma once

#include <expected>
#include <system_error>

namespace stratum::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_state,
  state_root_mismatch,
  missing_witness,
  unexpected_witness,
  unknown_module,
  malformed_operations
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace stratum::controller

template<>
struct std::is_error_code_enum< stratum::controller::controller_errc >: public std::true_type
{};
