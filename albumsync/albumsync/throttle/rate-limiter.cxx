#include <albumsync/throttle/rate-limiter.hxx>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

using namespace std;

namespace albumsync
{
  rate_limiter::
  rate_limiter (size_t l, clock::duration w)
    : limit_ (l == 0 ? 1 : l), window_ (w)
  {
  }

  void rate_limiter::
  expire (clock::time_point now)
  {
    while (!calls_.empty () && now - calls_.front () >= window_)
      calls_.pop_front ();
  }

  optional<rate_limiter::clock::duration> rate_limiter::
  try_acquire (clock::time_point now)
  {
    lock_guard<mutex> l (mutex_);

    expire (now);

    if (calls_.size () < limit_)
    {
      calls_.push_back (now);
      return nullopt;
    }

    return calls_.front () + window_ - now + wake_margin;
  }

  asio::awaitable<void> rate_limiter::
  wait_if_needed (cancellation_token* ct)
  {
    // Each pass either admits us or tells us how long the oldest call still
    // has to live. Another caller may grab the slot in the meantime, so
    // waking up is no guarantee and we simply ask again.
    //
    for (;;)
    {
      optional<clock::duration> d (try_acquire ());

      if (!d)
        co_return;

      if (ct != nullptr)
        co_await cancellable_sleep (*d, *ct);
      else
      {
        asio::steady_timer t (co_await asio::this_coro::executor, *d);
        co_await t.async_wait (asio::use_awaitable);
      }
    }
  }

  void rate_limiter::
  reset ()
  {
    lock_guard<mutex> l (mutex_);
    calls_.clear ();
  }

  size_t rate_limiter::
  recorded (clock::time_point now)
  {
    lock_guard<mutex> l (mutex_);
    expire (now);
    return calls_.size ();
  }
}
