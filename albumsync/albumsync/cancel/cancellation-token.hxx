#pragma once

#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>
#include <functional>

#include <boost/asio/awaitable.hpp>

namespace albumsync
{
  namespace asio = boost::asio;

  // Cooperative cancellation signal for one run.
  //
  // The state only ever moves from "running" to "cancelled" and the reason
  // given by the first cancel() call is the one that sticks. Listeners are
  // invoked synchronously by the thread calling cancel(), in registration
  // order, at most once each.
  //
  // Listeners usually cancel I/O objects (timers, sockets) bound to the
  // io_context, so cancel() is expected to be called from the thread running
  // that context (the signal handler is).
  //
  class cancellation_token
  {
  public:
    using listener_type = std::function<void (const std::string&)>;

    // Calling the returned function before cancellation removes the
    // listener. Calling it afterwards (or twice) does nothing.
    //
    using unregister_type = std::function<void ()>;

    cancellation_token () = default;

    cancellation_token (const cancellation_token&) = delete;
    cancellation_token& operator= (const cancellation_token&) = delete;

    // Request cancellation. Return true if this call made the transition and
    // false if the token was already cancelled.
    //
    bool
    cancel (const std::string& reason = "cancelled");

    bool
    cancelled () const noexcept
    {
      return cancelled_.load (std::memory_order_acquire);
    }

    std::optional<std::string>
    reason () const;

    // Throw operation_cancelled if cancelled.
    //
    void
    throw_if_cancelled () const;

    // Register a listener. If the token is already cancelled, the listener
    // is called right away (there is nothing left to wait for) and the
    // returned function is a no-op.
    //
    unregister_type
    on_cancel (listener_type);

    // Number of listeners still waiting to be notified.
    //
    std::size_t
    pending () const;

  private:
    struct entry
    {
      std::uint64_t id;
      listener_type fn;
    };

    mutable std::mutex mutex_;
    std::atomic<bool> cancelled_ {false};
    std::string reason_;
    std::vector<entry> listeners_;
    std::uint64_t next_id_ {0};
  };

  // Keep a cancellation listener registered for the lifetime of the scope.
  // A null token registers nothing.
  //
  // Listeners typically capture objects living in a coroutine frame, which
  // may be destroyed while suspended, so unregistering must not depend on
  // the coroutine ever resuming.
  //
  class cancel_guard
  {
  public:
    cancel_guard (cancellation_token* t,
                  cancellation_token::listener_type f)
    {
      if (t != nullptr)
        unreg_ = t->on_cancel (std::move (f));
    }

    ~cancel_guard ()
    {
      if (unreg_)
        unreg_ ();
    }

    cancel_guard (const cancel_guard&) = delete;
    cancel_guard& operator= (const cancel_guard&) = delete;

  private:
    cancellation_token::unregister_type unreg_;
  };

  // Sleep for the specified duration on the current coroutine's executor,
  // waking up early and throwing operation_cancelled if the token gets
  // cancelled in the meantime.
  //
  asio::awaitable<void>
  cancellable_sleep (std::chrono::steady_clock::duration,
                     cancellation_token&);
}
