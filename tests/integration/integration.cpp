// NOLINTBEGIN

#include <gtest/gtest.h>

#include <stratum/controller.hpp>
#include <stratum/log.hpp>
#include <stratum/state_db.hpp>
#include <test/fixture.hpp>

using stratum::controller::controller_errc;
using stratum::controller::operation;
using stratum::controller::runner;
using stratum::controller::slot_state;
using stratum::module::module_errc;
using stratum::state_db::state_db_errc;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "debug" )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  std::vector< operation > scenario_batch() const
  {
    return { make_credit_operation( test::module_ids::ledger_a, _bob, _alice, 10 ),
             make_debit_operation( test::module_ids::ledger_b, _alice, 3 ),
             make_debit_operation( test::module_ids::ledger_a, _alice, 100 ) };
  }

  stratum::controller::result< stratum::controller::slot_result >
  run_native( const std::vector< operation >& operations )
  {
    runner native( _runtime, _store );

    if( auto ec = native.begin_slot( _store.root() ); ec )
      return std::unexpected( ec );

    if( auto receipt = native.apply_batch( operations ); !verify( receipt, verification::processed ) )
      return std::unexpected( receipt.error() );

    return native.end_slot();
  }
};

TEST_F( integration, keys_are_namespaced_by_module )
{
  const auto& schema = _runtime->schema();

  auto a_balance = schema.find_field( test::module_ids::ledger_a, "balance" );
  auto b_balance = schema.find_field( test::module_ids::ledger_b, "balance" );
  ASSERT_TRUE( a_balance );
  ASSERT_TRUE( b_balance );

  auto a_key = schema.derive_key( test::module_ids::ledger_a, *a_balance, _alice );
  auto b_key = schema.derive_key( test::module_ids::ledger_b, *b_balance, _alice );
  ASSERT_TRUE( a_key );
  ASSERT_TRUE( b_key );
  EXPECT_NE( *a_key, *b_key );

  auto a_id = schema.find_module( "A" );
  ASSERT_TRUE( a_id );
  EXPECT_EQ( *a_id, test::module_ids::ledger_a );
}

TEST_F( integration, failed_operation_leaves_no_trace )
{
  auto genesis = _store.root();

  runner native( _runtime, _store );
  ASSERT_FALSE( native.begin_slot( genesis ) );
  EXPECT_EQ( native.state(), slot_state::slot_open );

  auto receipt = native.apply_batch( scenario_batch() );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  ASSERT_EQ( receipt->operations.size(), 3 );
  EXPECT_FALSE( receipt->operations[ 0 ].reverted );
  EXPECT_FALSE( receipt->operations[ 1 ].reverted );
  EXPECT_TRUE( receipt->operations[ 2 ].reverted );
  EXPECT_EQ( receipt->operations[ 2 ].error, module_errc::insufficient_balance );
  EXPECT_EQ( receipt->reverted_count(), 1 );

  auto closed = native.end_slot();
  ASSERT_TRUE( closed );
  EXPECT_EQ( closed->previous_root, genesis );
  EXPECT_EQ( closed->state_root, _store.root() );
  EXPECT_EQ( closed->operation_count, 3 );
  ASSERT_TRUE( closed->witness );
  EXPECT_EQ( native.state(), slot_state::idle );

  EXPECT_EQ( balance_of( test::module_ids::ledger_a, _alice ), 10 );
  EXPECT_EQ( balance_of( test::module_ids::ledger_b, _alice ), -3 );

  // The same state reached without the failing operation
  close_store();
  std::filesystem::remove( _state_dir / "state.bin" );
  ASSERT_FALSE( open_store() );
  ASSERT_EQ( _store.root(), genesis );

  auto batch = scenario_batch();
  batch.pop_back();
  auto without_failure = run_native( batch );
  ASSERT_TRUE( without_failure );
  EXPECT_EQ( without_failure->state_root, closed->state_root );
}

TEST_F( integration, verification_reproduces_native_root )
{
  auto genesis = _store.root();
  auto batch   = scenario_batch();

  auto native = run_native( batch );
  ASSERT_TRUE( native );
  ASSERT_TRUE( native->witness );

  const auto& w = *native->witness;
  EXPECT_EQ( w.previous_root, genesis );
  ASSERT_FALSE( w.reads.empty() );
  EXPECT_FALSE( w.reads.front().value );

  runner verifier( _runtime );
  EXPECT_FALSE( verifier.native() );
  ASSERT_FALSE( verifier.begin_slot( genesis, w ) );

  auto receipt = verifier.apply_batch( batch );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  EXPECT_EQ( receipt->reverted_count(), 1 );

  auto verified = verifier.end_slot();
  ASSERT_TRUE( verified );
  EXPECT_EQ( verified->state_root, native->state_root );
  EXPECT_FALSE( verified->witness );
}

TEST_F( integration, verification_across_slots )
{
  std::vector< operation > first = { make_credit_operation( test::module_ids::ledger_a, _bob, _alice, 50 ),
                                     make_initialize_operation( _alice ) };
  std::vector< operation > second = { make_set_operation( _alice, "hello" ),
                                      make_transfer_operation( test::module_ids::ledger_a, _alice, _bob, 5 ),
                                      make_set_operation( _bob, "denied" ) };

  auto slot_1 = run_native( first );
  ASSERT_TRUE( slot_1 );
  auto slot_2 = run_native( second );
  ASSERT_TRUE( slot_2 );
  EXPECT_EQ( slot_2->previous_root, slot_1->state_root );

  EXPECT_EQ( balance_of( test::module_ids::ledger_a, _alice ), 50 - 5 - static_cast< std::int64_t >( test::setter_fee ) );
  EXPECT_EQ( balance_of( test::module_ids::ledger_a, _collector ), static_cast< std::int64_t >( test::setter_fee ) );

  runner verifier( _runtime );

  for( const auto& [ slot, operations ]: { std::pair{ &*slot_1, &first }, std::pair{ &*slot_2, &second } } )
  {
    ASSERT_FALSE( verifier.begin_slot( slot->previous_root, slot->witness ) );
    ASSERT_TRUE( verify( verifier.apply_batch( *operations ), verification::processed ) );

    auto verified = verifier.end_slot();
    ASSERT_TRUE( verified );
    EXPECT_EQ( verified->state_root, slot->state_root );
  }
}

TEST_F( integration, omitted_witness_entry )
{
  auto genesis = _store.root();
  auto batch   = scenario_batch();

  auto native = run_native( batch );
  ASSERT_TRUE( native );

  auto w = *native->witness;
  w.reads.erase( w.reads.begin() );

  runner verifier( _runtime );
  ASSERT_FALSE( verifier.begin_slot( genesis, w ) );

  auto receipt = verifier.apply_batch( batch );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), state_db_errc::witness_mismatch );
  EXPECT_EQ( verifier.state(), slot_state::idle );
}

TEST_F( integration, truncated_witness )
{
  auto genesis = _store.root();
  auto batch   = scenario_batch();

  auto native = run_native( batch );
  ASSERT_TRUE( native );

  auto w = *native->witness;
  ASSERT_FALSE( w.reads.empty() );
  w.reads.pop_back();

  runner verifier( _runtime );
  ASSERT_FALSE( verifier.begin_slot( genesis, w ) );

  auto receipt = verifier.apply_batch( batch );
  ASSERT_FALSE( receipt );
  EXPECT_EQ( receipt.error(), state_db_errc::witness_mismatch );
  EXPECT_EQ( verifier.state(), slot_state::idle );

  w = *native->witness;
  ASSERT_FALSE( w.proofs.empty() );
  w.proofs.pop_back();

  ASSERT_FALSE( verifier.begin_slot( genesis, w ) );
  ASSERT_TRUE( verify( verifier.apply_batch( batch ), verification::processed ) );

  auto verified = verifier.end_slot();
  ASSERT_FALSE( verified );
  EXPECT_EQ( verified.error(), state_db_errc::witness_mismatch );
  EXPECT_EQ( verifier.state(), slot_state::idle );
}

TEST_F( integration, unused_witness_entry )
{
  auto genesis = _store.root();
  auto batch   = scenario_batch();

  auto native = run_native( batch );
  ASSERT_TRUE( native );

  auto w = *native->witness;
  w.reads.push_back( w.reads.front() );

  runner verifier( _runtime );
  ASSERT_FALSE( verifier.begin_slot( genesis, w ) );
  ASSERT_TRUE( verify( verifier.apply_batch( batch ), verification::processed ) );

  auto verified = verifier.end_slot();
  ASSERT_FALSE( verified );
  EXPECT_EQ( verified.error(), state_db_errc::witness_mismatch );
  EXPECT_EQ( verifier.state(), slot_state::idle );
}

TEST_F( integration, undecodable_value_reverts_operation )
{
  const auto& schema = _runtime->schema();

  auto total_field = schema.find_field( test::module_ids::ledger_a, "total" );
  ASSERT_TRUE( total_field );
  auto total_key = schema.derive_key( test::module_ids::ledger_a, *total_field );
  ASSERT_TRUE( total_key );

  _store.put( *total_key, stratum::state_db::storage_value( 3, std::byte{ 0x01 } ) );
  ASSERT_TRUE( _store.commit() );
  auto seeded = _store.root();

  std::vector< operation > batch{ make_credit_operation( test::module_ids::ledger_a, _bob, _alice, 10 ),
                                  make_debit_operation( test::module_ids::ledger_b, _alice, 3 ) };

  runner native( _runtime, _store );
  ASSERT_FALSE( native.begin_slot( seeded ) );

  auto receipt = native.apply_batch( batch );
  ASSERT_TRUE( verify( receipt, verification::processed ) );
  ASSERT_EQ( receipt->operations.size(), 2 );
  EXPECT_TRUE( receipt->operations[ 0 ].reverted );
  EXPECT_EQ( receipt->operations[ 0 ].error, module_errc::codec_failure );
  EXPECT_FALSE( receipt->operations[ 1 ].reverted );

  auto closed = native.end_slot();
  ASSERT_TRUE( closed );
  ASSERT_TRUE( closed->witness );
  EXPECT_NE( closed->state_root, seeded );

  EXPECT_EQ( balance_of( test::module_ids::ledger_a, _alice ), 0 );
  EXPECT_EQ( balance_of( test::module_ids::ledger_b, _alice ), -3 );

  runner verifier( _runtime );
  ASSERT_FALSE( verifier.begin_slot( seeded, closed->witness ) );

  auto replayed = verifier.apply_batch( batch );
  ASSERT_TRUE( verify( replayed, verification::processed ) );
  EXPECT_EQ( replayed->operations[ 0 ].error, module_errc::codec_failure );

  auto verified = verifier.end_slot();
  ASSERT_TRUE( verified );
  EXPECT_EQ( verified->state_root, closed->state_root );
}

TEST_F( integration, witness_transport )
{
  auto genesis = _store.root();
  auto batch   = scenario_batch();

  auto native = run_native( batch );
  ASSERT_TRUE( native );

  auto witness_bytes = native->witness->to_bytes();
  auto batch_bytes   = stratum::controller::encode_operations( batch );

  auto w          = stratum::state_db::witness::from_bytes( witness_bytes );
  auto operations = stratum::controller::decode_operations( batch_bytes );
  ASSERT_TRUE( w );
  ASSERT_TRUE( operations );
  EXPECT_EQ( *w, *native->witness );
  EXPECT_EQ( *operations, batch );

  runner verifier( _runtime );
  ASSERT_FALSE( verifier.begin_slot( genesis, std::move( *w ) ) );
  ASSERT_TRUE( verify( verifier.apply_batch( *operations ), verification::processed ) );

  auto verified = verifier.end_slot();
  ASSERT_TRUE( verified );
  EXPECT_EQ( verified->state_root, native->state_root );

  batch_bytes.pop_back();
  auto truncated = stratum::controller::decode_operations( batch_bytes );
  ASSERT_FALSE( truncated );
  EXPECT_EQ( truncated.error(), controller_errc::malformed_operations );
}

TEST_F( integration, state_persists_across_reopen )
{
  auto slot = run_native( scenario_batch() );
  ASSERT_TRUE( slot );
  auto revision = _store.revision();

  close_store();
  ASSERT_FALSE( open_store() );

  EXPECT_EQ( _store.root(), slot->state_root );
  EXPECT_EQ( _store.revision(), revision );
  EXPECT_EQ( balance_of( test::module_ids::ledger_a, _alice ), 10 );
  EXPECT_EQ( balance_of( test::module_ids::ledger_b, _alice ), -3 );
}

TEST_F( integration, slot_lifecycle )
{
  auto genesis = _store.root();
  runner native( _runtime, _store );

  EXPECT_EQ( native.apply_batch( {} ).error(), controller_errc::invalid_state );
  EXPECT_EQ( native.end_slot().error(), controller_errc::invalid_state );

  stratum::state_db::digest wrong_root{ std::byte{ 0x01 } };
  EXPECT_EQ( native.begin_slot( wrong_root ), controller_errc::state_root_mismatch );
  EXPECT_EQ( native.begin_slot( genesis, stratum::state_db::witness{} ), controller_errc::unexpected_witness );

  ASSERT_FALSE( native.begin_slot( genesis ) );
  EXPECT_EQ( native.begin_slot( genesis ), controller_errc::invalid_state );
  EXPECT_EQ( native.query( test::module_ids::ledger_a, {} ).error(), controller_errc::invalid_state );

  operation unknown;
  unknown.target = 42;

  auto receipt = native.apply_batch( std::vector< operation >{ unknown } );
  ASSERT_TRUE( receipt );
  ASSERT_EQ( receipt->operations.size(), 1 );
  EXPECT_TRUE( receipt->operations[ 0 ].reverted );
  EXPECT_EQ( receipt->operations[ 0 ].error, controller_errc::unknown_module );

  ASSERT_TRUE( native.apply_batch( std::vector< operation >{ make_initialize_operation( _alice ) } ) );

  native.discard_slot();
  EXPECT_EQ( native.state(), slot_state::idle );
  EXPECT_EQ( _store.root(), genesis );
  EXPECT_FALSE( _store.recording() );

  runner verifier( _runtime );
  EXPECT_EQ( verifier.begin_slot( genesis ), controller_errc::missing_witness );
  EXPECT_EQ( verifier.begin_slot( genesis, stratum::state_db::witness{ .previous_root = wrong_root } ),
             controller_errc::state_root_mismatch );
  EXPECT_EQ( verifier.query( test::module_ids::ledger_a, {} ).error(), controller_errc::invalid_state );
}

TEST_F( integration, query_is_read_only )
{
  ASSERT_TRUE( run_native( { make_credit_operation( test::module_ids::ledger_a, _bob, _alice, 7 ) } ) );
  auto root = _store.root();

  runner native( _runtime, _store );

  auto credit =
    native.query( test::module_ids::ledger_a, make_input( stratum::module::ledger::instruction::credit, _alice, 1ull ) );
  ASSERT_FALSE( credit );
  EXPECT_EQ( credit.error(), state_db_errc::read_only );

  auto total = native.query( test::module_ids::ledger_a, make_input( stratum::module::ledger::instruction::total ) );
  ASSERT_TRUE( total );
  EXPECT_EQ( *stratum::module::codec< std::int64_t >::decode( *total ), 7 );

  auto unknown = native.query( 42, {} );
  ASSERT_FALSE( unknown );
  EXPECT_EQ( unknown.error(), controller_errc::unknown_module );

  EXPECT_EQ( _store.root(), root );
}

// NOLINTEND
