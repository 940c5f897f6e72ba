#pragma once

#include <mutex>
#include <deque>
#include <chrono>
#include <cstddef>
#include <optional>

#include <boost/asio/awaitable.hpp>

namespace albumsync
{
  namespace asio = boost::asio;

  class cancellation_token;

  // Sliding window request throttle.
  //
  // Admits at most `limit` calls in any trailing window of `window`
  // duration (not fixed buckets: the window slides with every call). A call
  // over the limit suspends until the oldest recorded call falls out of the
  // window and then tries again, as many times as it takes.
  //
  class rate_limiter
  {
  public:
    using clock = std::chrono::steady_clock;

    // Defaults match what the server tolerates out of the box.
    //
    static constexpr std::size_t default_limit = 10;
    static constexpr std::chrono::milliseconds default_window {1000};

    // Added to every computed wait so that we wake up after, not right at,
    // the moment the oldest call expires.
    //
    static constexpr std::chrono::milliseconds wake_margin {10};

    explicit
    rate_limiter (std::size_t limit = default_limit,
                  clock::duration window = default_window);

    rate_limiter (const rate_limiter&) = delete;
    rate_limiter& operator= (const rate_limiter&) = delete;

    // Wait until the call can be admitted and record it. If the token is
    // cancelled while waiting, throw operation_cancelled.
    //
    asio::awaitable<void>
    wait_if_needed (cancellation_token* = nullptr);

    // Try to admit a call at the specified time. Return nullopt if admitted
    // (and recorded) or how long to wait before trying again.
    //
    std::optional<clock::duration>
    try_acquire (clock::time_point = clock::now ());

    // Forget all recorded calls.
    //
    void
    reset ();

    // Calls recorded within the window ending now.
    //
    std::size_t
    recorded (clock::time_point = clock::now ());

    std::size_t
    limit () const noexcept
    {
      return limit_;
    }

    clock::duration
    window () const noexcept
    {
      return window_;
    }

  private:
    void
    expire (clock::time_point);

    std::mutex mutex_;
    std::size_t limit_;
    clock::duration window_;
    std::deque<clock::time_point> calls_;
  };
}
