#include <stratum/module/codec.hpp>

#include <algorithm>

namespace stratum::module {

input_reader::input_reader( std::span< const std::byte > input ) noexcept:
    _input( input )
{}

std::error_code input_reader::read( std::span< std::byte > bytes ) noexcept
{
  if( bytes.size() > _input.size() )
    return module_errc::invalid_argument;

  std::ranges::copy( _input.first( bytes.size() ), bytes.begin() );
  _input = _input.subspan( bytes.size() );
  return {};
}

std::span< const std::byte > input_reader::remaining() const noexcept
{
  return _input;
}

bool input_reader::empty() const noexcept
{
  return _input.empty();
}

} // namespace stratum::module
