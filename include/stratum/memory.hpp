#pragma once

#include <stratum/memory/memory.hpp>
