#pragma once

#include <albumsync/progress/progress-types.hxx>

#include <array>
#include <mutex>
#include <chrono>
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <functional>

namespace albumsync
{
  // Traits for progress tracking customization.
  //
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;
    using clock_type = std::chrono::steady_clock;

    // Updates closer together than this are dropped (the final one never
    // is).
    //
    static constexpr std::chrono::milliseconds min_update_interval {100};

    // Number of throughput samples averaged for the reported speed.
    //
    static constexpr std::size_t sample_window_size = 10;

    // Format bytes as a human-readable string (IEC units).
    //
    static string_type
    format_bytes (std::uint64_t);

    static string_type
    format_speed (double bytes_per_sec);

    // 1h 02m 03s, 2m 03s, 3s.
    //
    static string_type
    format_duration (double seconds);
  };

  // Run progress aggregation.
  //
  // Many transfer tasks report concurrently, so all state is behind a
  // mutex. Each accepted update becomes a snapshot delivered to the sink
  // (outside of the lock). Rendering is someone else's problem.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using clock_type = typename traits_type::clock_type;
    using sink_type = std::function<void (const progress_snapshot&)>;

    explicit
    basic_progress_tracker (sink_type = nullptr);

    basic_progress_tracker (const basic_progress_tracker&) = delete;
    basic_progress_tracker& operator= (const basic_progress_tracker&) = delete;

    // Report `current` of `total` items done. Return true if the update was
    // accepted, false if it was throttled. The final update (current >=
    // total) is always accepted.
    //
    bool
    update (std::uint64_t current,
            std::uint64_t total,
            const progress_stats&);

    // Clear all rolling state (between albums).
    //
    void
    reset ();

    // Mean of the sample window in bytes/sec, 0 if there are no samples.
    //
    double
    speed () const;

    std::optional<progress_snapshot>
    last () const;

    void
    sink (sink_type);

  private:
    double
    mean () const;

    mutable std::mutex mutex_;
    sink_type sink_;

    std::optional<typename clock_type::time_point> last_time_;
    std::uint64_t last_bytes_ = 0;

    std::array<double, traits_type::sample_window_size> samples_ {};
    std::size_t sample_count_ = 0;
    std::size_t sample_index_ = 0;

    std::optional<progress_snapshot> last_;
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <albumsync/progress/progress-tracker.ixx>
#include <albumsync/progress/progress-tracker.txx>
