#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <stratum/module/ledger.hpp>
#include <stratum/module/module.hpp>
#include <stratum/module/state.hpp>

namespace stratum::module {

struct fee_schedule
{
  std::shared_ptr< const ledger > token;
  std::uint64_t amount = 0;
  principal collector{};
};

/**
 * value_setter stores a single value that only its admin may change. The
 * first caller of initialize becomes the admin. When a fee schedule is set,
 * every change of the value pays the fee to the collector through the ledger.
 */
struct value_setter final: public module
{
  static constexpr state_db::field_id admin_field = 0;
  static constexpr state_db::field_id value_field = 1;

  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    initialize,
    set,
    clear,
    get
  };

  value_setter( state_db::module_id id, std::string name, std::optional< fee_schedule > fee = {} );
  value_setter( const value_setter& ) = delete;
  value_setter( value_setter&& )      = delete;
  ~value_setter() override            = default;

  value_setter& operator=( const value_setter& ) = delete;
  value_setter& operator=( value_setter&& )      = delete;

  const state_db::module_descriptor& descriptor() const noexcept override;
  std::error_code call( context& ctx, std::span< const std::byte > input ) override;

private:
  std::error_code authorize( context& ctx ) const;
  std::error_code charge_fee( context& ctx ) const;

  state_db::module_descriptor _descriptor;
  std::optional< fee_schedule > _fee;
  state_value< principal > _admin;
  state_value< std::vector< std::byte > > _value;
};

} // namespace stratum::module
