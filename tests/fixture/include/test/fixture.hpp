#pragma once

#include <ranges>

#include <boost/endian.hpp>

#include <stratum/controller.hpp>
#include <stratum/memory.hpp>
#include <stratum/module.hpp>
#include <stratum/state_db.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace test {

namespace module_ids {

constexpr stratum::state_db::module_id ledger_a = 1;
constexpr stratum::state_db::module_id ledger_b = 2;
constexpr stratum::state_db::module_id setter   = 3;

} // namespace module_ids

constexpr std::int64_t ledger_b_overdraft = 100;
constexpr std::uint64_t setter_fee        = 1;

stratum::module::principal make_principal( std::string_view seed );

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  /**
   * Open the committed store over a file backend in the state directory. An
   * existing snapshot is reopened.
   */
  std::error_code open_store();
  void close_store();

  stratum::controller::operation make_credit_operation( stratum::state_db::module_id ledger,
                                                        const stratum::module::principal& caller,
                                                        const stratum::module::principal& account,
                                                        std::uint64_t amount ) const;
  stratum::controller::operation make_debit_operation( stratum::state_db::module_id ledger,
                                                       const stratum::module::principal& account,
                                                       std::uint64_t amount ) const;
  stratum::controller::operation make_transfer_operation( stratum::state_db::module_id ledger,
                                                          const stratum::module::principal& from,
                                                          const stratum::module::principal& to,
                                                          std::uint64_t amount ) const;
  stratum::controller::operation make_initialize_operation( const stratum::module::principal& caller ) const;
  stratum::controller::operation make_set_operation( const stratum::module::principal& caller,
                                                     std::string_view value ) const;

  template< std::integral T >
  void append_input( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = stratum::memory::as_bytes( std::addressof( t ), 1 );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< std::ranges::range T >
  void append_input( std::vector< std::byte >& input, const T& t ) const noexcept
  {
    const auto bytes = stratum::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_input( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_input( input, std::to_underlying( t ) );
  }

  template< typename... Args >
  std::vector< std::byte > make_input( Args... args ) const noexcept
  {
    std::vector< std::byte > input;
    ( ( append_input( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  std::int64_t balance_of( stratum::state_db::module_id ledger, const stratum::module::principal& account );

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    without_reversion = 1 << 1
  };

  bool verify( const stratum::controller::result< stratum::controller::batch_receipt >& receipt,
               std::uint64_t flags ) const;

  std::shared_ptr< stratum::module::ledger > _ledger_a;
  std::shared_ptr< stratum::module::ledger > _ledger_b;
  std::shared_ptr< stratum::module::value_setter > _setter;
  std::shared_ptr< const stratum::controller::runtime > _runtime;

  std::filesystem::path _state_dir;
  std::shared_ptr< stratum::state_db::backends::file::file_backend > _backend;
  stratum::state_db::committed_store _store;

  stratum::module::principal _alice;
  stratum::module::principal _bob;
  stratum::module::principal _collector;
};

} // namespace test
