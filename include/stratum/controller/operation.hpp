#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/vector.hpp>

#include <stratum/controller/error.hpp>
#include <stratum/module/module.hpp>
#include <stratum/state_db/types.hpp>
#include <stratum/state_db/witness.hpp>

namespace stratum::controller {

/**
 * A call of a module by a principal. The input is passed to the module as is.
 */
struct operation
{
  state_db::module_id target = 0;
  module::principal caller{};
  std::vector< std::byte > input;

  bool operator==( const operation& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & target;
    ar & caller;
    ar & input;
  }
};

std::vector< std::byte > encode_operations( std::span< const operation > operations );
result< std::vector< operation > > decode_operations( std::span< const std::byte > bytes );

struct operation_receipt
{
  std::uint64_t index = 0;
  bool reverted       = false;
  std::error_code error;
  std::vector< std::byte > output;
};

struct batch_receipt
{
  std::vector< operation_receipt > operations;

  std::size_t reverted_count() const noexcept;
};

struct slot_result
{
  state_db::digest previous_root{};
  state_db::digest state_root{};
  std::optional< state_db::witness > witness;
  std::uint64_t operation_count = 0;
};

} // namespace stratum::controller
