#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <stratum/crypto/hash.hpp>

namespace stratum::state_db {

enum class commitment_algorithm : std::uint_fast8_t
{
  blake3_sparse_merkle
};

enum class field_kind : std::uint8_t
{
  value,
  map
};

class store;
class committed_store;
class replay_store;
class working_set;
class key_schema;

using storage_key   = std::vector< std::byte >;
using storage_value = std::vector< std::byte >;
using digest        = crypto::digest;
using module_id     = std::uint32_t;
using field_id      = std::uint32_t;

constexpr digest empty_root = {};

} // namespace stratum::state_db
