#pragma once

#include <stratum/state_db/backends/map/map_backend.hpp>

#include <filesystem>
#include <system_error>

namespace stratum::state_db::backends::file {

/**
 * file_backend keeps its contents in memory and persists a snapshot of the
 * contents and metadata at the end of every write batch. The snapshot is
 * written to a temporary file and renamed over the previous one, so a failed
 * batch leaves the previous snapshot in place.
 */
class file_backend final: public map::map_backend
{
public:
  file_backend();
  file_backend( const file_backend& )            = delete;
  file_backend( file_backend&& )                 = delete;
  file_backend& operator=( const file_backend& ) = delete;
  file_backend& operator=( file_backend&& )      = delete;
  ~file_backend() final;

  /**
   * Open the snapshot at path. A missing file opens an empty backend.
   */
  std::error_code open( const std::filesystem::path& path );

  const std::filesystem::path& path() const noexcept;

  std::error_code end_write_batch() override;

private:
  std::error_code write_snapshot() const;

  std::filesystem::path _path;
};

} // namespace stratum::state_db::backends::file
