#pragma once

#include <expected>
#include <system_error>

namespace stratum::module {

enum class module_errc : int // NOLINT(performance-enum-size)
{
  ok,
  unauthorized,
  invalid_instruction,
  insufficient_balance,
  invalid_argument,
  overflow,
  codec_failure,
  not_initialized,
  already_initialized
};

const std::error_category& module_category() noexcept;

std::error_code make_error_code( module_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace stratum::module

template<>
struct std::is_error_code_enum< stratum::module::module_errc >: public std::true_type
{};
