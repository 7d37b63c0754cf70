// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/filesystem.hpp>

#include <stratum/crypto.hpp>
#include <stratum/log.hpp>

#include <quill/core/LogLevel.h>

namespace test {

stratum::module::principal make_principal( std::string_view seed )
{
  return stratum::crypto::hash( seed );
}

fixture::fixture( const std::string& name, const std::string& log_level ):
    _alice( make_principal( "alice" ) ),
    _bob( make_principal( "bob" ) ),
    _collector( make_principal( "collector" ) )
{
  stratum::log::initialize();
  stratum::log::instance()->set_log_level( quill::loglevel_from_string( log_level ) );

  _ledger_a = std::make_shared< stratum::module::ledger >( module_ids::ledger_a, "A" );
  _ledger_b = std::make_shared< stratum::module::ledger >( module_ids::ledger_b, "B", ledger_b_overdraft );
  _setter   = std::make_shared< stratum::module::value_setter >(
    module_ids::setter,
    "setter",
    stratum::module::fee_schedule{ .token = _ledger_a, .amount = setter_fee, .collector = _collector } );

  auto rt = stratum::controller::runtime::create( { .modules = { _ledger_a, _ledger_b, _setter } } );
  if( !rt )
    throw std::runtime_error( "invalid test runtime: " + rt.error().message() );

  _runtime = std::move( *rt );

  _state_dir = std::filesystem::temp_directory_path() / boost::filesystem::unique_path().string();
  LOG_INFO( stratum::log::instance(), "Using temporary directory for {}: {}", name, _state_dir.string() );
  std::filesystem::create_directory( _state_dir );

  if( auto ec = open_store(); ec )
    throw std::runtime_error( "unable to open test store: " + ec.message() );
}

fixture::~fixture()
{
  close_store();
  std::filesystem::remove_all( _state_dir );
}

std::error_code fixture::open_store()
{
  close_store();

  _backend = std::make_shared< stratum::state_db::backends::file::file_backend >();
  if( auto ec = _backend->open( _state_dir / "state.bin" ); ec )
    return ec;

  return _store.open( _backend );
}

void fixture::close_store()
{
  _store.close();
  _backend.reset();
}

stratum::controller::operation fixture::make_credit_operation( stratum::state_db::module_id ledger,
                                                               const stratum::module::principal& caller,
                                                               const stratum::module::principal& account,
                                                               std::uint64_t amount ) const
{
  stratum::controller::operation op;
  op.target = ledger;
  op.caller = caller;
  op.input  = make_input( stratum::module::ledger::instruction::credit, account, amount );
  return op;
}

stratum::controller::operation fixture::make_debit_operation( stratum::state_db::module_id ledger,
                                                              const stratum::module::principal& account,
                                                              std::uint64_t amount ) const
{
  stratum::controller::operation op;
  op.target = ledger;
  op.caller = account;
  op.input  = make_input( stratum::module::ledger::instruction::debit, account, amount );
  return op;
}

stratum::controller::operation fixture::make_transfer_operation( stratum::state_db::module_id ledger,
                                                                 const stratum::module::principal& from,
                                                                 const stratum::module::principal& to,
                                                                 std::uint64_t amount ) const
{
  stratum::controller::operation op;
  op.target = ledger;
  op.caller = from;
  op.input  = make_input( stratum::module::ledger::instruction::transfer, from, to, amount );
  return op;
}

stratum::controller::operation fixture::make_initialize_operation( const stratum::module::principal& caller ) const
{
  stratum::controller::operation op;
  op.target = module_ids::setter;
  op.caller = caller;
  op.input  = make_input( stratum::module::value_setter::instruction::initialize );
  return op;
}

stratum::controller::operation fixture::make_set_operation( const stratum::module::principal& caller,
                                                            std::string_view value ) const
{
  stratum::controller::operation op;
  op.target = module_ids::setter;
  op.caller = caller;
  op.input  = make_input( stratum::module::value_setter::instruction::set, value );
  return op;
}

std::int64_t fixture::balance_of( stratum::state_db::module_id ledger, const stratum::module::principal& account )
{
  stratum::controller::runner r( _runtime, _store );

  auto output = r.query( ledger, make_input( stratum::module::ledger::instruction::balance_of, account ) );
  if( !output )
    throw std::runtime_error( "balance query failed: " + output.error().message() );

  auto balance = stratum::module::codec< std::int64_t >::decode( *output );
  if( !balance )
    throw std::runtime_error( "balance query returned malformed output" );

  return *balance;
}

bool fixture::verify( const stratum::controller::result< stratum::controller::batch_receipt >& receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( stratum::log::instance(), "Batch application has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    for( const auto& op_receipt: receipt->operations )
    {
      if( op_receipt.reverted )
      {
        LOG_ERROR( stratum::log::instance(),
                   "Operation {} was reverted: {}",
                   op_receipt.index,
                   op_receipt.error.message() );
        return false;
      }
    }
  }

  return true;
}

} // namespace test

// NOLINTEND
