#include <stratum/controller/runtime.hpp>

#include <stratum/log.hpp>

#include <stdexcept>

namespace stratum::controller {

result< std::shared_ptr< const runtime > > runtime::create( runtime_config config )
{
  std::vector< state_db::module_descriptor > descriptors;
  descriptors.reserve( config.modules.size() );

  for( const auto& m: config.modules )
  {
    if( !m )
      throw std::invalid_argument( "module does not exist" );

    descriptors.push_back( m->descriptor() );
  }

  auto schema = state_db::key_schema::create( std::move( descriptors ) );
  if( !schema )
  {
    LOG_ERROR( log::instance(), "Invalid runtime configuration: {}", schema.error().message() );
    return std::unexpected( schema.error() );
  }

  LOG_INFO( log::instance(), "Configured runtime with {} module(s)", config.modules.size() );

  return std::shared_ptr< const runtime >( new runtime( std::move( *schema ), std::move( config ) ) );
}

runtime::runtime( state_db::key_schema schema, runtime_config config ):
    _schema( std::move( schema ) ),
    _algorithm( config.algorithm )
{
  for( auto& m: config.modules )
  {
    auto id = m->id();
    _modules.emplace( id, std::move( m ) );
  }
}

const state_db::key_schema& runtime::schema() const noexcept
{
  return _schema;
}

state_db::commitment_algorithm runtime::algorithm() const noexcept
{
  return _algorithm;
}

std::shared_ptr< module::module > runtime::find( state_db::module_id id ) const
{
  if( auto itr = _modules.find( id ); itr != _modules.end() )
    return itr->second;

  return {};
}

const std::map< state_db::module_id, std::shared_ptr< module::module > >& runtime::modules() const noexcept
{
  return _modules;
}

} // namespace stratum::controller
