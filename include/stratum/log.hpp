#pragma once

#include <stratum/log/log.hpp>
