#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <stratum/encode.hpp>

namespace stratum::log {

struct hex_tag
{};

// Binary data (roots, keys) copied on the hot path and hex encoded by the backend thread
using hex = quill::BinaryData< hex_tag >;

} // namespace stratum::log

template<>
struct fmtquill::formatter< stratum::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const stratum::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                stratum::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< stratum::log::hex >: quill::BinaryDataDeferredFormatCodec< stratum::log::hex >
{};
