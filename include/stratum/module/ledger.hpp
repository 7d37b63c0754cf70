#pragma once

#include <cstdint>
#include <string>

#include <stratum/module/error.hpp>
#include <stratum/module/module.hpp>
#include <stratum/module/state.hpp>

namespace stratum::module {

/**
 * ledger keeps a signed balance per principal. A balance may go down to
 * -overdraft_limit, so a ledger with no overdraft behaves as a plain token
 * and a ledger with one as a credit line.
 */
struct ledger final: public module
{
  static constexpr state_db::field_id balance_field = 0;
  static constexpr state_db::field_id total_field   = 1;

  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    balance_of,
    total,
    credit,
    debit,
    transfer
  };

  ledger( state_db::module_id id, std::string name, std::int64_t overdraft_limit = 0 );
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger() override      = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  const state_db::module_descriptor& descriptor() const noexcept override;
  std::error_code call( context& ctx, std::span< const std::byte > input ) override;

  result< std::int64_t > balance_of( context& ctx, const principal& account ) const;
  result< std::int64_t > total( context& ctx ) const;

  std::error_code credit( context& ctx, const principal& account, std::uint64_t amount ) const;
  std::error_code debit( context& ctx, const principal& account, std::uint64_t amount ) const;

  /**
   * Move amount from one account to another. The caller of the context must
   * own the source account.
   */
  std::error_code transfer( context& ctx, const principal& from, const principal& to, std::uint64_t amount ) const;

  std::int64_t overdraft_limit() const noexcept;

private:
  std::error_code adjust_total( context& ctx, std::int64_t delta ) const;

  state_db::module_descriptor _descriptor;
  std::int64_t _overdraft_limit;
  state_map< principal, std::int64_t > _balances;
  state_value< std::int64_t > _total;
};

} // namespace stratum::module
