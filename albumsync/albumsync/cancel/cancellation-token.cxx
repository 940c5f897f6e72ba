#include <albumsync/cancel/cancellation-token.hxx>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <albumsync/albumsync-errors.hxx>

using namespace std;

namespace albumsync
{
  bool cancellation_token::
  cancel (const string& r)
  {
    vector<entry> ls;
    {
      lock_guard<mutex> l (mutex_);

      if (cancelled_.load (memory_order_relaxed))
        return false;

      reason_ = r;
      cancelled_.store (true, memory_order_release);

      // Take the listeners out so that each is notified exactly once and so
      // that we don't hold the lock while running foreign code (a listener
      // may well call back into us).
      //
      ls.swap (listeners_);
    }

    for (const entry& e: ls)
      e.fn (r);

    return true;
  }

  optional<string> cancellation_token::
  reason () const
  {
    lock_guard<mutex> l (mutex_);

    if (!cancelled_.load (memory_order_relaxed))
      return nullopt;

    return reason_;
  }

  void cancellation_token::
  throw_if_cancelled () const
  {
    if (optional<string> r = reason ())
      throw operation_cancelled (*r);
  }

  cancellation_token::unregister_type cancellation_token::
  on_cancel (listener_type f)
  {
    string r;
    {
      lock_guard<mutex> l (mutex_);

      if (!cancelled_.load (memory_order_relaxed))
      {
        uint64_t id (next_id_++);
        listeners_.push_back (entry {id, move (f)});

        return [this, id] ()
        {
          lock_guard<mutex> l (mutex_);

          for (auto i (listeners_.begin ()); i != listeners_.end (); ++i)
          {
            if (i->id == id)
            {
              listeners_.erase (i);
              break;
            }
          }
        };
      }

      r = reason_;
    }

    f (r);
    return [] () {};
  }

  size_t cancellation_token::
  pending () const
  {
    lock_guard<mutex> l (mutex_);
    return listeners_.size ();
  }

  asio::awaitable<void>
  cancellable_sleep (chrono::steady_clock::duration d,
                     cancellation_token& ct)
  {
    ct.throw_if_cancelled ();

    asio::steady_timer t (co_await asio::this_coro::executor, d);

    // An aborted wait is how cancellation reaches us, so the error code
    // itself is of no interest. Whether we were cancelled is.
    //
    boost::system::error_code ec;
    {
      cancel_guard g (&ct, [&t] (const string&) {t.cancel ();});
      co_await t.async_wait (asio::redirect_error (asio::use_awaitable, ec));
    }

    ct.throw_if_cancelled ();
  }
}
