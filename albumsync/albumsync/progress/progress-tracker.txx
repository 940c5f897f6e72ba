#include <cmath>
#include <sstream>
#include <iomanip>

namespace albumsync
{
  // progress_tracker_traits default implementations.
  //
  template <typename S>
  S progress_tracker_traits<S>::
  format_bytes (std::uint64_t n)
  {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    std::ostringstream o;

    if (n < 1024)
    {
      o << n << " B";
      return o.str ();
    }

    double v (static_cast<double> (n));
    std::size_t i (0);

    while (v >= 1024.0 && i + 1 < sizeof (units) / sizeof (units[0]))
    {
      v /= 1024.0;
      ++i;
    }

    o << std::fixed << std::setprecision (1) << v << ' ' << units[i];
    return o.str ();
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_speed (double bps)
  {
    if (!(bps > 0.0) || !std::isfinite (bps))
      return S ("0 B/s");

    return format_bytes (static_cast<std::uint64_t> (bps)) + "/s";
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (double s)
  {
    if (!std::isfinite (s) || s < 0)
      return S ("unknown");

    std::uint64_t t (static_cast<std::uint64_t> (s));
    std::uint64_t h (t / 3600);
    std::uint64_t m ((t % 3600) / 60);
    std::uint64_t sec (t % 60);

    std::ostringstream o;

    if (h > 0)
      o << h << "h " << std::setfill ('0') << std::setw (2) << m << "m "
        << std::setw (2) << sec << 's';
    else if (m > 0)
      o << m << "m " << std::setfill ('0') << std::setw (2) << sec << 's';
    else
      o << sec << 's';

    return o.str ();
  }

  template <typename T>
  double basic_progress_tracker<T>::
  mean () const
  {
    if (sample_count_ == 0)
      return 0.0;

    double s (0.0);
    for (std::size_t i (0); i < sample_count_; ++i)
      s += samples_[i];

    return s / static_cast<double> (sample_count_);
  }

  template <typename T>
  bool basic_progress_tracker<T>::
  update (std::uint64_t cur,
          std::uint64_t tot,
          const progress_stats& st)
  {
    using namespace std::chrono;

    progress_snapshot s;
    sink_type f;
    {
      std::lock_guard<std::mutex> l (mutex_);

      auto now (clock_type::now ());
      bool fin (cur >= tot);

      if (!fin && last_time_ &&
          now - *last_time_ < traits_type::min_update_interval)
        return false;

      // Instantaneous throughput since the previous accepted update. The
      // ring keeps the newest sample_window_size ones, overwriting the
      // oldest.
      //
      if (last_time_)
      {
        double dt (duration<double> (now - *last_time_).count ());

        if (dt > 0.0)
        {
          std::uint64_t db (st.transferred_bytes > last_bytes_
                            ? st.transferred_bytes - last_bytes_
                            : 0);

          samples_[sample_index_] = static_cast<double> (db) / dt;
          sample_index_ = (sample_index_ + 1) % samples_.size ();

          if (sample_count_ < samples_.size ())
            ++sample_count_;
        }
      }

      last_time_ = now;
      last_bytes_ = st.transferred_bytes;

      s.total = tot;
      s.current = cur > tot ? tot : cur;
      s.stats = st;
      s.speed = mean ();
      s.final = fin;

      std::uint64_t tb (st.total_bytes ());

      if (s.speed > 0.0 && tb != 0)
      {
        std::uint64_t left (tb > st.transferred_bytes
                            ? tb - st.transferred_bytes
                            : 0);
        s.eta_seconds = static_cast<double> (left) / s.speed;
      }

      last_ = s;
      f = sink_;
    }

    if (f)
      f (s);

    return true;
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset ()
  {
    std::lock_guard<std::mutex> l (mutex_);

    last_time_.reset ();
    last_bytes_ = 0;
    samples_.fill (0.0);
    sample_count_ = 0;
    sample_index_ = 0;
    last_.reset ();
  }
}
