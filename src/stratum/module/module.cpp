#include <stratum/module/module.hpp>

#include <utility>

namespace stratum::module {

context::context( state_db::working_set& state, const state_db::key_schema& schema, const principal& caller ) noexcept:
    _state( state ),
    _schema( schema ),
    _caller( caller )
{}

state_db::working_set& context::state() noexcept
{
  return _state;
}

const state_db::key_schema& context::schema() const noexcept
{
  return _schema;
}

const principal& context::caller() const noexcept
{
  return _caller;
}

void context::write_output( std::span< const std::byte > bytes )
{
  _output.insert( _output.end(), bytes.begin(), bytes.end() );
}

const std::vector< std::byte >& context::output() const noexcept
{
  return _output;
}

std::vector< std::byte > context::take_output() noexcept
{
  return std::exchange( _output, {} );
}

state_db::module_id module::id() const noexcept
{
  return descriptor().id;
}

} // namespace stratum::module
