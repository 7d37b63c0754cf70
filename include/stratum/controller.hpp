#pragma once

#include <stratum/controller/error.hpp>
#include <stratum/controller/operation.hpp>
#include <stratum/controller/runner.hpp>
#include <stratum/controller/runtime.hpp>
