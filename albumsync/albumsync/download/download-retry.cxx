#include <albumsync/download/download-retry.hxx>

#include <sstream>

#include <albumsync/albumsync-log.hxx>
#include <albumsync/albumsync-errors.hxx>
#include <albumsync/throttle/rate-limiter.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

using namespace std;

namespace albumsync
{
  retry_policy::
  retry_policy (retry_options o, rate_limiter& l, cancellation_token& t)
    : options_ (move (o)), limiter_ (l), token_ (t), rng_ (random_device {} ())
  {
  }

  chrono::milliseconds retry_policy::
  backoff (uint32_t attempt) const
  {
    using chrono::milliseconds;

    if (attempt == 0)
      return milliseconds (0);

    // Past 2^30 any sane base is over the cap anyway.
    //
    uint32_t e (attempt - 1);

    if (e >= 31)
      return options_.max_delay;

    auto d (options_.base_delay.count () * (static_cast<int64_t> (1) << e));

    if (options_.base_delay.count () != 0 &&
        d / options_.base_delay.count () != (static_cast<int64_t> (1) << e))
      return options_.max_delay;

    return min (milliseconds (d), options_.max_delay);
  }

  chrono::milliseconds retry_policy::
  jitter ()
  {
    if (options_.max_jitter.count () <= 0)
      return chrono::milliseconds (0);

    lock_guard<mutex> l (rng_mutex_);
    uniform_int_distribution<int64_t> d (0, options_.max_jitter.count ());
    return chrono::milliseconds (d (rng_));
  }

  asio::awaitable<transfer_result> retry_policy::
  run (asset_source& src, const asset& a, const fs::path& dest)
  {
    transfer_result r;

    if (options_.size_limit && a.size > *options_.size_limit)
    {
      r.status = transfer_status::skipped;
      co_return r;
    }

    uint32_t n (attempts ());

    for (uint32_t i (1);; ++i)
    {
      token_.throw_if_cancelled ();
      co_await limiter_.wait_if_needed (&token_);

      r.attempts = i;

      bool fatal (false);
      try
      {
        co_await src.fetch (a, dest, options_.timeout, token_);

        r.status = transfer_status::succeeded;
        r.error.clear ();
        co_return r;
      }
      catch (const operation_cancelled&)
      {
        throw;
      }
      catch (const error& e)
      {
        r.error = e.what ();
        fatal = !e.retryable ();
      }
      catch (const exception& e)
      {
        r.error = e.what ();
      }

      // A transfer that broke because we were pulling the plug on it is a
      // cancellation, whatever it threw.
      //
      if (token_.cancelled ())
        throw operation_cancelled (token_.reason ().value_or ("cancelled"));

      if (fatal || i >= n)
      {
        r.status = transfer_status::failed;
        co_return r;
      }

      chrono::milliseconds d (backoff (i) + jitter ());

      if (log::verbose ())
      {
        ostringstream os;
        os << a.name << ": attempt " << i << '/' << n << " failed ("
           << r.error << "), retrying in " << d.count () << "ms";
        log::trace (os.str ());
      }

      co_await cancellable_sleep (d, token_);
    }
  }
}
