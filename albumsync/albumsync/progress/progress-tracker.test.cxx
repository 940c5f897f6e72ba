#include <albumsync/progress/progress-tracker.hxx>

#include <cmath>
#include <atomic>
#include <cassert>
#include <thread>
#include <chrono>
#include <vector>

using namespace std;
using namespace std::chrono;
using namespace albumsync;

using traits = progress_tracker_traits<>;

static progress_stats
stats (uint64_t bytes, uint64_t declared = 0, uint64_t observed = 0)
{
  progress_stats s;
  s.downloaded = 1;
  s.transferred_bytes = bytes;
  s.declared_bytes = declared;
  s.observed_bytes = observed;
  return s;
}

static void
test_format ()
{
  assert (traits::format_bytes (0) == "0 B");
  assert (traits::format_bytes (1023) == "1023 B");
  assert (traits::format_bytes (1024) == "1.0 KiB");
  assert (traits::format_bytes (1536) == "1.5 KiB");
  assert (traits::format_bytes (5ULL * 1024 * 1024) == "5.0 MiB");
  assert (traits::format_bytes (3ULL * 1024 * 1024 * 1024) == "3.0 GiB");
  assert (traits::format_bytes (2ULL * 1024 * 1024 * 1024 * 1024) == "2.0 TiB");

  assert (traits::format_speed (0.0) == "0 B/s");
  assert (traits::format_speed (2048.0) == "2.0 KiB/s");

  assert (traits::format_duration (5) == "5s");
  assert (traits::format_duration (125) == "2m 05s");
  assert (traits::format_duration (3723) == "1h 02m 03s");
  assert (traits::format_duration (-1) == "unknown");
}

// Only the first of two quick updates gets through; the final one always
// does.
//
static void
test_throttle ()
{
  size_t seen (0);
  progress_tracker t ([&seen] (const progress_snapshot&) {++seen;});

  assert (t.update (1, 10, stats (100)));
  assert (!t.update (2, 10, stats (200)));
  assert (seen == 1);

  assert (t.update (10, 10, stats (1000)));
  assert (seen == 2);
  assert (t.last ()->final);

  this_thread::sleep_for (traits::min_update_interval + milliseconds (20));
  assert (t.update (3, 10, stats (300)));
  assert (seen == 3);
}

static void
test_speed_eta ()
{
  progress_tracker t;

  t.update (0, 4, stats (0, 4000000));
  assert (t.speed () == 0.0);
  assert (!t.last ()->eta_seconds);

  this_thread::sleep_for (milliseconds (150));
  t.update (1, 4, stats (1000000, 4000000));

  double s (t.speed ());
  assert (s > 0.0);

  // 1 MB in no less than 150 ms.
  //
  assert (s <= 1000000.0 / 0.150 + 1.0);

  optional<progress_snapshot> p (t.last ());
  assert (p->eta_seconds);
  assert (*p->eta_seconds > 0.0);
  assert (std::abs (*p->eta_seconds - 3000000.0 / s) < 1e-6);

  // Without a byte total, no ETA.
  //
  this_thread::sleep_for (milliseconds (120));
  t.update (2, 4, stats (2000000));
  assert (!t.last ()->eta_seconds);

  // Observed total stands in for a missing declared one.
  //
  this_thread::sleep_for (milliseconds (120));
  t.update (3, 4, stats (3000000, 0, 4000000));
  assert (t.last ()->eta_seconds);
  assert (t.last ()->stats.total_bytes () == 4000000);
}

// The window is bounded: after more than sample_window_size updates, only
// the most recent samples count.
//
static void
test_window ()
{
  progress_tracker t;
  uint64_t b (0);

  t.update (0, 100, stats (b));

  // Fast phase.
  //
  for (size_t i (0); i < traits::sample_window_size; ++i)
  {
    this_thread::sleep_for (traits::min_update_interval + milliseconds (5));
    b += 10000000;
    t.update (i + 1, 100, stats (b));
  }

  double fast (t.speed ());

  // Idle phase replaces every fast sample with a zero one.
  //
  for (size_t i (0); i < traits::sample_window_size; ++i)
  {
    this_thread::sleep_for (traits::min_update_interval + milliseconds (5));
    t.update (50 + i, 100, stats (b));
  }

  assert (fast > 0.0);
  assert (t.speed () == 0.0);
}

static void
test_clamp_reset ()
{
  progress_tracker t;

  t.update (12, 10, stats (0));
  assert (t.last ()->current == 10);
  assert (t.last ()->total == 10);

  t.reset ();
  assert (!t.last ());
  assert (t.speed () == 0.0);

  // After a reset, the first update is accepted right away.
  //
  assert (t.update (1, 10, stats (0)));
}

static void
test_ratio ()
{
  progress_snapshot s;
  assert (s.ratio () == 0.0);

  s.total = 4;
  s.current = 1;
  assert (s.ratio () == 0.25);

  s.stats.declared_bytes = 1000;
  s.stats.transferred_bytes = 500;
  assert (s.ratio () == 0.5);

  s.stats.transferred_bytes = 5000;
  assert (s.ratio () == 1.0);
}

static void
test_concurrent ()
{
  atomic<size_t> seen (0);
  progress_tracker t ([&seen] (const progress_snapshot&) {++seen;});

  vector<thread> ts;
  for (int i (0); i < 8; ++i)
    ts.emplace_back ([&t] ()
    {
      for (int j (0); j <= 1000; ++j)
        t.update (j, 1000, stats (j));
    });

  for (thread& x: ts)
    x.join ();

  // At least every thread's final update went through.
  //
  assert (seen >= 8);
  assert (t.last ());
}

int
main ()
{
  test_format ();
  test_throttle ();
  test_speed_eta ();
  test_window ();
  test_clamp_reset ();
  test_ratio ();
  test_concurrent ();
}
