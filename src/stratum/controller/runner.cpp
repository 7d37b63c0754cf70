#include <stratum/controller/runner.hpp>

#include <stratum/log.hpp>
#include <stratum/state_db/error.hpp>

#include <stdexcept>

namespace stratum::controller {

runner::runner( std::shared_ptr< const runtime > rt, state_db::committed_store& store ):
    _runtime( std::move( rt ) ),
    _committed( &store )
{
  if( !_runtime )
    throw std::invalid_argument( "runtime does not exist" );
}

runner::runner( std::shared_ptr< const runtime > rt ):
    _runtime( std::move( rt ) )
{
  if( !_runtime )
    throw std::invalid_argument( "runtime does not exist" );
}

runner::~runner()
{
  discard_slot();
}

bool runner::native() const noexcept
{
  return _committed != nullptr;
}

slot_state runner::state() const noexcept
{
  return _state;
}

std::error_code runner::begin_slot( const state_db::digest& previous_root, std::optional< state_db::witness > w )
{
  if( _state != slot_state::idle )
    return controller_errc::invalid_state;

  if( native() )
  {
    if( w )
      return controller_errc::unexpected_witness;

    // Another runner has a slot open on this store
    if( _committed->recording() )
      return controller_errc::invalid_state;

    if( _committed->root() != previous_root )
    {
      LOG_WARNING( log::instance(),
                   "Slot root {} does not match committed root {}",
                   log::hex{ previous_root.data(), previous_root.size() },
                   log::hex{ _committed->root().data(), _committed->root().size() } );
      return controller_errc::state_root_mismatch;
    }

    _committed->begin_recording();
    _working_set = std::make_unique< state_db::working_set >( *_committed );
  }
  else
  {
    if( !w )
      return controller_errc::missing_witness;

    if( w->previous_root != previous_root )
      return controller_errc::state_root_mismatch;

    _replay      = std::make_unique< state_db::replay_store >( std::move( *w ) );
    _working_set = std::make_unique< state_db::working_set >( *_replay );
  }

  _state           = slot_state::slot_open;
  _previous_root   = previous_root;
  _operation_count = 0;

  LOG_INFO( log::instance(),
            "Slot opened - Mode: {}, Root: {}",
            native() ? "native" : "verification",
            log::hex{ previous_root.data(), previous_root.size() } );

  return {};
}

result< batch_receipt > runner::apply_batch( std::span< const operation > operations )
{
  if( _state != slot_state::slot_open )
    return std::unexpected( controller_errc::invalid_state );

  _state = slot_state::batch_open;

  batch_receipt receipt;
  receipt.operations.reserve( operations.size() );

  for( const auto& op: operations )
  {
    std::error_code fatal;
    receipt.operations.emplace_back( apply( op, _operation_count++, fatal ) );

    if( fatal )
    {
      abort_slot( fatal );
      return std::unexpected( fatal );
    }
  }

  _state = slot_state::slot_open;

  LOG_DEBUG( log::instance(),
             "Batch applied [{} operation(s), {} reverted]",
             receipt.operations.size(),
             receipt.reverted_count() );

  return receipt;
}

result< slot_result > runner::end_slot()
{
  if( _state != slot_state::slot_open )
    return std::unexpected( controller_errc::invalid_state );

  _state = slot_state::slot_closed;

  auto root = _working_set->flush();
  if( !root )
  {
    abort_slot( root.error() );
    return std::unexpected( root.error() );
  }

  if( _replay )
  {
    if( auto ec = _replay->verify_consumed(); ec )
    {
      abort_slot( ec );
      return std::unexpected( ec );
    }
  }

  slot_result closed{ .previous_root   = _previous_root,
                      .state_root      = *root,
                      .witness         = std::nullopt,
                      .operation_count = _operation_count };

  if( native() )
    closed.witness = _committed->take_witness();

  _working_set.reset();
  _replay.reset();
  _state = slot_state::idle;

  LOG_INFO( log::instance(),
            "Slot closed - Root: {} [{} operation(s)]",
            log::hex{ closed.state_root.data(), closed.state_root.size() },
            closed.operation_count );

  return closed;
}

void runner::discard_slot() noexcept
{
  if( _state == slot_state::idle )
    return;

  if( _working_set )
    _working_set->clear();

  if( native() )
    _committed->discard();

  _working_set.reset();
  _replay.reset();
  _state           = slot_state::idle;
  _operation_count = 0;
}

result< std::vector< std::byte > >
runner::query( state_db::module_id target, std::span< const std::byte > input, const module::principal& caller )
{
  if( !native() || _state != slot_state::idle || _committed->recording() )
    return std::unexpected( controller_errc::invalid_state );

  auto m = _runtime->find( target );
  if( !m )
    return std::unexpected( controller_errc::unknown_module );

  state_db::working_set state( *_committed, true );
  module::context ctx( state, _runtime->schema(), caller );

  if( auto ec = m->call( ctx, input ); ec )
    return std::unexpected( ec );

  if( state.fault() )
    return std::unexpected( state.fault() );

  return ctx.take_output();
}

operation_receipt runner::apply( const operation& op, std::uint64_t index, std::error_code& fatal )
{
  operation_receipt receipt{ .index = index };

  auto m = _runtime->find( op.target );
  if( !m )
  {
    LOG_WARNING( log::instance(), "Operation {} reverted: unknown module {}", index, op.target );
    receipt.reverted = true;
    receipt.error    = controller_errc::unknown_module;
    return receipt;
  }

  auto checkpoint = _working_set->make_checkpoint();
  module::context ctx( *_working_set, _runtime->schema(), op.caller );

  auto ec = m->call( ctx, op.input );

  if( _working_set->fault() )
    fatal = _working_set->fault();
  else if( ec && state_db::is_fatal( ec ) )
    fatal = ec;

  if( ec || fatal )
  {
    _working_set->revert( checkpoint );
    receipt.reverted = true;
    receipt.error    = fatal ? fatal : ec;

    if( !fatal )
      LOG_WARNING( log::instance(),
                   "Operation {} on module '{}' reverted: {}",
                   index,
                   m->descriptor().name,
                   ec.message() );

    return receipt;
  }

  _working_set->squash( checkpoint );
  receipt.output = ctx.take_output();
  return receipt;
}

void runner::abort_slot( const std::error_code& ec ) noexcept
{
  LOG_ERROR( log::instance(), "Slot discarded: {}", ec.message() );
  discard_slot();
}

} // namespace stratum::controller
