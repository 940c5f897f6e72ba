#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>

#include <odb/core.hxx>

namespace albumsync
{
  // Terminal outcome recorded for an asset.
  //
  enum class ledger_status
  {
    downloaded,
    failed,
    skipped
  };

  inline std::ostream&
  operator<< (std::ostream& os, ledger_status s)
  {
    switch (s)
    {
      case ledger_status::downloaded: return os << "downloaded";
      case ledger_status::failed:     return os << "failed";
      case ledger_status::skipped:    return os << "skipped";
    }
    return os;
  }

  // One row per asset. A later outcome for the same asset simply replaces
  // the earlier one, whatever album it was recorded under.
  //
  // The (album, status) index serves the "failed in this album" lookup used
  // for resume-only runs and for retention cleanup.
  //
  #pragma db object table("downloads")
  class ledger_entry
  {
  public:
    ledger_entry () = default;

    ledger_entry (std::string asset,
                  std::string album,
                  ledger_status s,
                  std::string checksum,
                  std::string dir,
                  std::int64_t at,
                  std::string error = "")
      : asset_id_ (std::move (asset)),
        album_id_ (std::move (album)),
        status_ (s),
        checksum_ (std::move (checksum)),
        target_dir_ (std::move (dir)),
        recorded_at_ (at),
        error_ (std::move (error))
    {
    }

    const std::string&
    asset_id () const noexcept { return asset_id_; }

    const std::string&
    album_id () const noexcept { return album_id_; }

    ledger_status
    status () const noexcept { return status_; }

    const std::string&
    checksum () const noexcept { return checksum_; }

    const std::string&
    target_dir () const noexcept { return target_dir_; }

    // Milliseconds since the UNIX epoch.
    //
    std::int64_t
    recorded_at () const noexcept { return recorded_at_; }

    void
    recorded_at (std::int64_t v) noexcept { recorded_at_ = v; }

    const std::string&
    error () const noexcept { return error_; }

  private:
    friend class odb::access;

    #pragma db id
    std::string asset_id_;

    #pragma db not_null
    std::string album_id_;

    #pragma db not_null
    ledger_status status_ = ledger_status::failed;

    std::string checksum_;
    std::string target_dir_;

    #pragma db not_null index
    std::int64_t recorded_at_ = 0;

    std::string error_;

    #pragma db index("downloads_album_status_i") members(album_id_, status_)
  };
}
