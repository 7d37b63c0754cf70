#pragma once

#include <stratum/module/codec.hpp>
#include <stratum/module/error.hpp>
#include <stratum/module/ledger.hpp>
#include <stratum/module/module.hpp>
#include <stratum/module/state.hpp>
#include <stratum/module/value_setter.hpp>
