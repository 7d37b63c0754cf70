#include <stratum/module/ledger.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

namespace stratum::module {

namespace {

constexpr auto max_amount = static_cast< std::uint64_t >( std::numeric_limits< std::int64_t >::max() );

bool checked_add( std::int64_t a, std::int64_t b, std::int64_t& out ) noexcept
{
  if( b > 0 && std::numeric_limits< std::int64_t >::max() - b < a )
    return false;

  if( b < 0 && std::numeric_limits< std::int64_t >::min() - b > a )
    return false;

  out = a + b;
  return true;
}

} // namespace

ledger::ledger( state_db::module_id id, std::string name, std::int64_t overdraft_limit ):
    _descriptor{ .id     = id,
                 .name   = std::move( name ),
                 .fields = { { .id = balance_field, .name = "balance", .kind = state_db::field_kind::map },
                             { .id = total_field, .name = "total", .kind = state_db::field_kind::value } } },
    _overdraft_limit( overdraft_limit ),
    _balances( id, balance_field ),
    _total( id, total_field )
{
  if( overdraft_limit < 0 )
    throw std::invalid_argument( "overdraft limit cannot be negative" );
}

const state_db::module_descriptor& ledger::descriptor() const noexcept
{
  return _descriptor;
}

std::int64_t ledger::overdraft_limit() const noexcept
{
  return _overdraft_limit;
}

result< std::int64_t > ledger::balance_of( context& ctx, const principal& account ) const
{
  return _balances.get_or( ctx, account, 0 );
}

result< std::int64_t > ledger::total( context& ctx ) const
{
  return _total.get_or( ctx, 0 );
}

std::error_code ledger::credit( context& ctx, const principal& account, std::uint64_t amount ) const
{
  if( amount > max_amount )
    return module_errc::overflow;

  auto balance = balance_of( ctx, account );
  if( !balance )
    return balance.error();

  std::int64_t new_balance = 0;
  if( !checked_add( *balance, static_cast< std::int64_t >( amount ), new_balance ) )
    return module_errc::overflow;

  if( auto ec = adjust_total( ctx, static_cast< std::int64_t >( amount ) ); ec )
    return ec;

  return _balances.set( ctx, account, new_balance );
}

std::error_code ledger::debit( context& ctx, const principal& account, std::uint64_t amount ) const
{
  if( ctx.caller() != account )
    return module_errc::unauthorized;

  if( amount > max_amount )
    return module_errc::insufficient_balance;

  auto balance = balance_of( ctx, account );
  if( !balance )
    return balance.error();

  std::int64_t new_balance = 0;
  if( !checked_add( *balance, -static_cast< std::int64_t >( amount ), new_balance ) || new_balance < -_overdraft_limit )
    return module_errc::insufficient_balance;

  if( auto ec = adjust_total( ctx, -static_cast< std::int64_t >( amount ) ); ec )
    return ec;

  return _balances.set( ctx, account, new_balance );
}

std::error_code
ledger::transfer( context& ctx, const principal& from, const principal& to, std::uint64_t amount ) const
{
  if( from == to )
    return module_errc::invalid_argument;

  if( ctx.caller() != from )
    return module_errc::unauthorized;

  if( amount > max_amount )
    return module_errc::insufficient_balance;

  auto from_balance = balance_of( ctx, from );
  if( !from_balance )
    return from_balance.error();

  std::int64_t new_from_balance = 0;
  if( !checked_add( *from_balance, -static_cast< std::int64_t >( amount ), new_from_balance )
      || new_from_balance < -_overdraft_limit )
    return module_errc::insufficient_balance;

  auto to_balance = balance_of( ctx, to );
  if( !to_balance )
    return to_balance.error();

  std::int64_t new_to_balance = 0;
  if( !checked_add( *to_balance, static_cast< std::int64_t >( amount ), new_to_balance ) )
    return module_errc::overflow;

  if( auto ec = _balances.set( ctx, from, new_from_balance ); ec )
    return ec;

  return _balances.set( ctx, to, new_to_balance );
}

std::error_code ledger::call( context& ctx, std::span< const std::byte > input )
{
  input_reader reader( input );

  std::uint32_t selector = 0;
  if( auto ec = reader.read( selector ); ec )
    return module_errc::invalid_instruction;

  switch( selector )
  {
    case std::to_underlying( instruction::balance_of ):
      {
        principal account{};
        if( auto ec = reader.read( account ); ec )
          return ec;

        auto balance = balance_of( ctx, account );
        if( !balance )
          return balance.error();

        ctx.write_output( codec< std::int64_t >::encode( *balance ) );
        break;
      }
    case std::to_underlying( instruction::total ):
      {
        auto value = total( ctx );
        if( !value )
          return value.error();

        ctx.write_output( codec< std::int64_t >::encode( *value ) );
        break;
      }
    case std::to_underlying( instruction::credit ):
      {
        principal account{};
        std::uint64_t amount = 0;

        if( auto ec = reader.read( account ); ec )
          return ec;
        if( auto ec = reader.read( amount ); ec )
          return ec;

        return credit( ctx, account, amount );
      }
    case std::to_underlying( instruction::debit ):
      {
        principal account{};
        std::uint64_t amount = 0;

        if( auto ec = reader.read( account ); ec )
          return ec;
        if( auto ec = reader.read( amount ); ec )
          return ec;

        return debit( ctx, account, amount );
      }
    case std::to_underlying( instruction::transfer ):
      {
        principal from{};
        principal to{};
        std::uint64_t amount = 0;

        if( auto ec = reader.read( from ); ec )
          return ec;
        if( auto ec = reader.read( to ); ec )
          return ec;
        if( auto ec = reader.read( amount ); ec )
          return ec;

        return transfer( ctx, from, to, amount );
      }
    default:
      return module_errc::invalid_instruction;
  }

  return module_errc::ok;
}

std::error_code ledger::adjust_total( context& ctx, std::int64_t delta ) const
{
  auto current = total( ctx );
  if( !current )
    return current.error();

  std::int64_t new_total = 0;
  if( !checked_add( *current, delta, new_total ) )
    return module_errc::overflow;

  return _total.set( ctx, new_total );
}

} // namespace stratum::module
