#include <stratum/state_db/error.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace stratum::state_db {

struct _state_db_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "state_db";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< state_db_errc >( condition ) )
    {
      case state_db_errc::ok:
        return "ok"s;
      case state_db_errc::key_collision:
        return "storage key collision"s;
      case state_db_errc::duplicate_name:
        return "duplicate name"s;
      case state_db_errc::unknown_module:
        return "unknown module"s;
      case state_db_errc::unknown_field:
        return "unknown field"s;
      case state_db_errc::field_kind_mismatch:
        return "field kind mismatch"s;
      case state_db_errc::sub_key_too_large:
        return "sub key too large"s;
      case state_db_errc::witness_mismatch:
        return "witness mismatch"s;
      case state_db_errc::invalid_proof:
        return "invalid proof"s;
      case state_db_errc::malformed_witness:
        return "malformed witness"s;
      case state_db_errc::backend_io_failure:
        return "backend io failure"s;
      case state_db_errc::read_only:
        return "state is read only"s;
    }
    std::unreachable();
  }
};

const std::error_category& state_db_category() noexcept
{
  static _state_db_category category;
  return category;
}

std::error_code make_error_code( state_db_errc e )
{
  return std::error_code( static_cast< int >( e ), state_db_category() );
}

bool is_fatal( const std::error_code& ec ) noexcept
{
  if( ec.category() != state_db_category() )
    return false;

  switch( static_cast< state_db_errc >( ec.value() ) )
  {
    case state_db_errc::witness_mismatch:
    case state_db_errc::invalid_proof:
    case state_db_errc::malformed_witness:
    case state_db_errc::backend_io_failure:
      return true;
    default:
      return false;
  }
}

} // namespace stratum::state_db
