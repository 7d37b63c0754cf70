#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace stratum::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept;

} // namespace stratum::encode
