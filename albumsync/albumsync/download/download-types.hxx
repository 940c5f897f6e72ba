#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <ostream>
#include <optional>
#include <filesystem>

namespace albumsync
{
  namespace fs = std::filesystem;

  // A single transferable item, already normalized from whatever shape the
  // server returned. Immutable once listed.
  //
  struct asset
  {
    std::string id;
    std::string album_id;
    std::string name;       // Original file name (may be unsafe).
    std::string checksum;   // Base64 SHA-1 as reported by the server.
    std::uint64_t size = 0; // Declared size, 0 if unknown.
  };

  // A named group of assets mapped to one destination directory. The asset
  // list is filled in lazily (listing albums does not return it).
  //
  struct album
  {
    std::string id;
    std::string name;
    std::uint64_t asset_count = 0;
    std::vector<asset> assets;
  };

  // Run configuration for one album.
  //
  struct download_options
  {
    static constexpr std::size_t default_concurrency = 5;
    static constexpr std::size_t max_concurrency = 50;

    bool force = false;              // Re-download even if present.
    bool resume_failed_only = false; // Only assets that failed last time.
    bool dry_run = false;            // Classify only, touch nothing.
    bool verbose = false;

    std::size_t concurrency = default_concurrency;
    std::uint32_t max_retries = 3;

    // Assets declaring more than this are skipped without a transfer.
    //
    std::optional<std::uint64_t> size_limit;
  };

  // Per-asset terminal classification.
  //
  enum class asset_outcome
  {
    downloaded, // Transferred (or would be, in a dry run).
    skipped,    // Already present, or over the size limit.
    failed      // Gave up.
  };

  inline std::ostream&
  operator<< (std::ostream& os, asset_outcome o)
  {
    switch (o)
    {
      case asset_outcome::downloaded: return os << "downloaded";
      case asset_outcome::skipped:    return os << "skipped";
      case asset_outcome::failed:     return os << "failed";
    }
    return os;
  }

  // Failure detail kept for the summary.
  //
  struct failed_item
  {
    std::string name;
    std::string asset_id;
    std::string error;

    failed_item () = default;

    failed_item (std::string n, std::string id, std::string e)
      : name (std::move (n)), asset_id (std::move (id)), error (std::move (e))
    {
    }
  };

  // Outcome of one album run.
  //
  struct download_summary
  {
    static constexpr std::size_t max_failures = 20;

    std::string album;
    fs::path directory;

    std::size_t total = 0;      // Assets considered.
    std::size_t attempted = 0;  // Assets that reached classification.
    std::size_t downloaded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;

    std::uint64_t transferred_bytes = 0; // Downloaded (measured).
    std::uint64_t skipped_bytes = 0;     // Already present or over limit.
    std::uint64_t total_bytes = 0;       // Declared, else observed.

    // At most max_failures entries. The rest are only counted.
    //
    std::vector<failed_item> failures;
    std::size_t more_failures = 0;

    bool cancelled = false;
    std::string cancel_reason;

    // Failure list recording honoring the bound.
    //
    void
    add_failure (failed_item f)
    {
      if (failures.size () < max_failures)
        failures.push_back (std::move (f));
      else
        ++more_failures;
    }

    bool
    empty () const noexcept
    {
      return total == 0;
    }
  };

  // Print the human-readable report. Verbose adds asset ids and full error
  // text to each listed failure; otherwise errors are cut short.
  //
  void
  print_summary (std::ostream&, const download_summary&, bool verbose);
}
