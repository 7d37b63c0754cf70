#include <stratum/state_db/backends/backend.hpp>

namespace stratum::state_db::backends {

bool abstract_backend::empty() const
{
  return size() == 0;
}

std::uint64_t abstract_backend::revision() const
{
  return _revision;
}

void abstract_backend::set_revision( std::uint64_t revision )
{
  _revision = revision;
}

const digest& abstract_backend::merkle_root() const
{
  return _merkle_root;
}

void abstract_backend::set_merkle_root( const digest& merkle_root )
{
  _merkle_root = merkle_root;
}

} // namespace stratum::state_db::backends
