#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <algorithm>

namespace albumsync
{
  // Aggregate counters pushed by the orchestrator after every terminal
  // classification.
  //
  // The byte total comes in two flavors. The declared one is the sum of the
  // sizes the server reported up front and never changes during a run. The
  // observed one accumulates measured sizes as assets complete and is only
  // used when nothing was declared, so the "total" is never a single
  // counter mutated under the reader's feet.
  //
  struct progress_stats
  {
    std::size_t downloaded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;

    std::uint64_t transferred_bytes = 0; // Downloaded plus skipped.
    std::uint64_t declared_bytes = 0;
    std::uint64_t observed_bytes = 0;

    std::size_t
    attempted () const noexcept
    {
      return downloaded + skipped + failed;
    }

    std::uint64_t
    total_bytes () const noexcept
    {
      return declared_bytes != 0 ? declared_bytes : observed_bytes;
    }
  };

  // What the tracker hands to its sink.
  //
  struct progress_snapshot
  {
    std::uint64_t current = 0; // Items done (clamped to total).
    std::uint64_t total = 0;   // Items in the run.

    progress_stats stats;

    // Smoothed throughput in bytes/sec.
    //
    double speed = 0.0;

    // Absent when the speed or the byte total is unknown.
    //
    std::optional<double> eta_seconds;

    bool final = false;

    // Completion ratio in [0, 1]. Bytes when we know the total, item count
    // otherwise.
    //
    double
    ratio () const noexcept
    {
      if (std::uint64_t t = stats.total_bytes ())
        return std::min (1.0, static_cast<double> (stats.transferred_bytes) /
                              static_cast<double> (t));

      if (total != 0)
        return static_cast<double> (current) / static_cast<double> (total);

      return 0.0;
    }
  };
}
