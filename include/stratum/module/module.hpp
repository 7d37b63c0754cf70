#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <system_error>
#include <vector>

#include <stratum/module/error.hpp>
#include <stratum/state_db/key_schema.hpp>
#include <stratum/state_db/working_set.hpp>

namespace stratum::module {

using principal = std::array< std::byte, 32 >;

/**
 * context is what a module sees of the slot while it runs: the working set,
 * the key schema of the runtime, the principal that issued the operation and
 * an output buffer for returned data.
 *
 * A module calling another module passes its own context along.
 */
class context final
{
public:
  context( state_db::working_set& state, const state_db::key_schema& schema, const principal& caller ) noexcept;
  context( const context& )            = delete;
  context( context&& )                 = delete;
  context& operator=( const context& ) = delete;
  context& operator=( context&& )      = delete;
  ~context()                           = default;

  state_db::working_set& state() noexcept;
  const state_db::key_schema& schema() const noexcept;
  const principal& caller() const noexcept;

  void write_output( std::span< const std::byte > bytes );
  const std::vector< std::byte >& output() const noexcept;
  std::vector< std::byte > take_output() noexcept;

private:
  state_db::working_set& _state;
  const state_db::key_schema& _schema;
  principal _caller;
  std::vector< std::byte > _output;
};

struct module
{
  module()                = default;
  module( const module& ) = delete;
  module( module&& )      = delete;
  virtual ~module()       = default;

  module& operator=( const module& ) = delete;
  module& operator=( module&& )      = delete;

  virtual const state_db::module_descriptor& descriptor() const noexcept = 0;

  /**
   * Execute one operation. The first 4 bytes of input select the instruction
   * (u32 little endian), the rest are its arguments.
   */
  virtual std::error_code call( context& ctx, std::span< const std::byte > input ) = 0;

  state_db::module_id id() const noexcept;
};

} // namespace stratum::module
