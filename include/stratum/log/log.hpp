#pragma once

#include <quill/LogMacros.h>

#include <stratum/log/formatter.hpp>
#include <stratum/log/frontend.hpp>

namespace stratum::log {

void initialize() noexcept;
logger* instance() noexcept;

} // namespace stratum::log
