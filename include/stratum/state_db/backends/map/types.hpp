#pragma once

#include <stratum/state_db/types.hpp>

#include <map>
#include <optional>

namespace stratum::state_db::backends::map {

using map_type      = std::map< storage_key, storage_value >;
using iterator_type = map_type::iterator;

// Prior value of every key touched by an open write batch
using undo_log_type = std::map< storage_key, std::optional< storage_value > >;

} // namespace stratum::state_db::backends::map
