#pragma once

#include <map>
#include <memory>
#include <vector>

#include <stratum/controller/error.hpp>
#include <stratum/module/module.hpp>
#include <stratum/state_db/key_schema.hpp>
#include <stratum/state_db/types.hpp>

namespace stratum::controller {

struct runtime_config
{
  std::vector< std::shared_ptr< module::module > > modules;
  state_db::commitment_algorithm algorithm = state_db::commitment_algorithm::blake3_sparse_merkle;
};

/**
 * runtime is the validated, immutable configuration of a rollup: its modules
 * and the key schema derived from their descriptors.
 */
class runtime final
{
public:
  runtime( const runtime& )            = delete;
  runtime( runtime&& )                 = delete;
  runtime& operator=( const runtime& ) = delete;
  runtime& operator=( runtime&& )      = delete;
  ~runtime()                           = default;

  /**
   * Validate the configuration. Fails with key_collision or duplicate_name if
   * the module descriptors do not form a valid key schema.
   */
  static result< std::shared_ptr< const runtime > > create( runtime_config config );

  const state_db::key_schema& schema() const noexcept;
  state_db::commitment_algorithm algorithm() const noexcept;

  std::shared_ptr< module::module > find( state_db::module_id id ) const;
  const std::map< state_db::module_id, std::shared_ptr< module::module > >& modules() const noexcept;

private:
  runtime( state_db::key_schema schema, runtime_config config );

  state_db::key_schema _schema;
  std::map< state_db::module_id, std::shared_ptr< module::module > > _modules;
  state_db::commitment_algorithm _algorithm;
};

} // namespace stratum::controller
