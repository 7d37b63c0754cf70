#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <stratum/controller/error.hpp>
#include <stratum/controller/operation.hpp>
#include <stratum/controller/runtime.hpp>
#include <stratum/state_db/committed_store.hpp>
#include <stratum/state_db/replay_store.hpp>
#include <stratum/state_db/working_set.hpp>

namespace stratum::controller {

enum class slot_state : std::uint8_t
{
  idle,
  slot_open,
  batch_open,
  slot_closed
};

/**
 * runner drives the lifecycle of a slot:
 *
 *   begin_slot -> apply_batch* -> end_slot
 *
 * A native runner executes against a committed store and produces a witness.
 * A verification runner executes against the witness alone. Given the same
 * previous root and operations, both produce the same state root.
 *
 * Operations run one at a time, each inside a checkpoint of the working set.
 * A failed operation is reverted and the slot goes on. A fatal error (witness
 * mismatch, backend failure) discards the slot and returns the runner to idle.
 */
class runner final
{
public:
  runner( std::shared_ptr< const runtime > rt, state_db::committed_store& store );
  explicit runner( std::shared_ptr< const runtime > rt );
  runner( const runner& )            = delete;
  runner( runner&& )                 = delete;
  runner& operator=( const runner& ) = delete;
  runner& operator=( runner&& )      = delete;
  ~runner();

  bool native() const noexcept;
  slot_state state() const noexcept;

  std::error_code begin_slot( const state_db::digest& previous_root, std::optional< state_db::witness > w = {} );
  result< batch_receipt > apply_batch( std::span< const operation > operations );
  result< slot_result > end_slot();
  void discard_slot() noexcept;

  /**
   * Call a module against the committed state without changing it. Only
   * available on a native runner in between slots.
   */
  result< std::vector< std::byte > >
  query( state_db::module_id target, std::span< const std::byte > input, const module::principal& caller = {} );

private:
  operation_receipt apply( const operation& op, std::uint64_t index, std::error_code& fatal );
  void abort_slot( const std::error_code& ec ) noexcept;

  std::shared_ptr< const runtime > _runtime;
  state_db::committed_store* _committed = nullptr;
  std::unique_ptr< state_db::replay_store > _replay;
  std::unique_ptr< state_db::working_set > _working_set;
  slot_state _state = slot_state::idle;
  state_db::digest _previous_root{};
  std::uint64_t _operation_count = 0;
};

} // namespace stratum::controller
