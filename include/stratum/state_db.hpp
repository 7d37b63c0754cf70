#pragma once

#include <stratum/state_db/backends/backend.hpp>
#include <stratum/state_db/backends/file/file_backend.hpp>
#include <stratum/state_db/backends/map/map_backend.hpp>
#include <stratum/state_db/committed_store.hpp>
#include <stratum/state_db/error.hpp>
#include <stratum/state_db/key_schema.hpp>
#include <stratum/state_db/replay_store.hpp>
#include <stratum/state_db/store.hpp>
#include <stratum/state_db/types.hpp>
#include <stratum/state_db/witness.hpp>
#include <stratum/state_db/working_set.hpp>
