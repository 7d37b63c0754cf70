#include <stratum/controller/error.hpp>

#include <string>
#include <utility>

namespace stratum::controller {

struct _controller_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "controller";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< controller_errc >( condition ) )
    {
      case controller_errc::ok:
        return "ok"s;
      case controller_errc::invalid_state:
        return "operation is not allowed in the current slot state"s;
      case controller_errc::state_root_mismatch:
        return "state root mismatch"s;
      case controller_errc::missing_witness:
        return "missing witness"s;
      case controller_errc::unexpected_witness:
        return "unexpected witness"s;
      case controller_errc::unknown_module:
        return "unknown module"s;
      case controller_errc::malformed_operations:
        return "malformed operations"s;
    }
    std::unreachable();
  }
};

const std::error_category& controller_category() noexcept
{
  static _controller_category category;
  return category;
}

std::error_code make_error_code( controller_errc e )
{
  return std::error_code( static_cast< int >( e ), controller_category() );
}

} // namespace stratum::controller
