#include <stratum/module/error.hpp>

#include <string>
#include <utility>

namespace stratum::module {

struct _module_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "module";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< module_errc >( condition ) )
    {
      case module_errc::ok:
        return "ok"s;
      case module_errc::unauthorized:
        return "unauthorized"s;
      case module_errc::invalid_instruction:
        return "invalid instruction"s;
      case module_errc::insufficient_balance:
        return "insufficient balance"s;
      case module_errc::invalid_argument:
        return "invalid argument"s;
      case module_errc::overflow:
        return "overflow"s;
      case module_errc::codec_failure:
        return "value could not be decoded"s;
      case module_errc::not_initialized:
        return "module is not initialized"s;
      case module_errc::already_initialized:
        return "module is already initialized"s;
    }
    std::unreachable();
  }
};

const std::error_category& module_category() noexcept
{
  static _module_category category;
  return category;
}

std::error_code make_error_code( module_errc e )
{
  return std::error_code( static_cast< int >( e ), module_category() );
}

} // namespace stratum::module
