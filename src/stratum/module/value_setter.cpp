#include <stratum/module/value_setter.hpp>

#include <stdexcept>
#include <utility>

namespace stratum::module {

value_setter::value_setter( state_db::module_id id, std::string name, std::optional< fee_schedule > fee ):
    _descriptor{ .id     = id,
                 .name   = std::move( name ),
                 .fields = { { .id = admin_field, .name = "admin", .kind = state_db::field_kind::value },
                             { .id = value_field, .name = "value", .kind = state_db::field_kind::value } } },
    _fee( std::move( fee ) ),
    _admin( id, admin_field ),
    _value( id, value_field )
{
  if( _fee && !_fee->token )
    throw std::invalid_argument( "fee schedule requires a ledger" );
}

const state_db::module_descriptor& value_setter::descriptor() const noexcept
{
  return _descriptor;
}

std::error_code value_setter::call( context& ctx, std::span< const std::byte > input )
{
  input_reader reader( input );

  std::uint32_t selector = 0;
  if( auto ec = reader.read( selector ); ec )
    return module_errc::invalid_instruction;

  switch( selector )
  {
    case std::to_underlying( instruction::initialize ):
      {
        auto admin = _admin.get( ctx );
        if( !admin )
          return admin.error();

        if( admin->has_value() )
          return module_errc::already_initialized;

        return _admin.set( ctx, ctx.caller() );
      }
    case std::to_underlying( instruction::set ):
      {
        if( auto ec = authorize( ctx ); ec )
          return ec;

        if( auto ec = charge_fee( ctx ); ec )
          return ec;

        auto bytes = reader.remaining();
        return _value.set( ctx, std::vector< std::byte >( bytes.begin(), bytes.end() ) );
      }
    case std::to_underlying( instruction::clear ):
      {
        if( auto ec = authorize( ctx ); ec )
          return ec;

        if( auto ec = charge_fee( ctx ); ec )
          return ec;

        return _value.remove( ctx );
      }
    case std::to_underlying( instruction::get ):
      {
        auto value = _value.get( ctx );
        if( !value )
          return value.error();

        if( *value )
          ctx.write_output( **value );
        break;
      }
    default:
      return module_errc::invalid_instruction;
  }

  return module_errc::ok;
}

std::error_code value_setter::authorize( context& ctx ) const
{
  auto admin = _admin.get( ctx );
  if( !admin )
    return admin.error();

  if( !admin->has_value() )
    return module_errc::not_initialized;

  if( **admin != ctx.caller() )
    return module_errc::unauthorized;

  return {};
}

std::error_code value_setter::charge_fee( context& ctx ) const
{
  if( !_fee || !_fee->amount )
    return {};

  return _fee->token->transfer( ctx, ctx.caller(), _fee->collector, _fee->amount );
}

} // namespace stratum::module
