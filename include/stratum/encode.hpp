#pragma once

#include <stratum/encode/hex.hpp>
