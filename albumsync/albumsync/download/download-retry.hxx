#pragma once

#include <mutex>
#include <chrono>
#include <random>
#include <string>
#include <cstdint>
#include <optional>
#include <ostream>
#include <filesystem>

#include <boost/asio/awaitable.hpp>

#include <albumsync/download/download-types.hxx>

namespace albumsync
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  class rate_limiter;
  class cancellation_token;

  // Where asset bytes come from.
  //
  // One call is one attempt: the implementation streams the asset to dest
  // within the timeout and either leaves a complete file there or no file at
  // all. It throws albumsync::error (retryable () telling whether trying
  // again makes sense) on failure and operation_cancelled if the token got
  // cancelled while it was at it.
  //
  class asset_source
  {
  public:
    virtual
    ~asset_source () = default;

    virtual asio::awaitable<void>
    fetch (const asset&,
           const fs::path& dest,
           std::chrono::milliseconds timeout,
           cancellation_token&) = 0;
  };

  struct retry_options
  {
    // Total number of attempts. Zero is treated as one.
    //
    std::uint32_t max_attempts = 3;

    // Delay before attempt n+1 is min (base_delay * 2^(n-1), max_delay) plus
    // up to max_jitter.
    //
    std::chrono::milliseconds base_delay {1000};
    std::chrono::milliseconds max_delay {10000};
    std::chrono::milliseconds max_jitter {500};

    // Per-attempt timeout passed on to the source.
    //
    std::chrono::milliseconds timeout {30000};

    // Assets declaring more bytes than this are not transferred.
    //
    std::optional<std::uint64_t> size_limit;
  };

  enum class transfer_status
  {
    succeeded,
    skipped,   // Over the size limit, never attempted.
    failed
  };

  inline std::ostream&
  operator<< (std::ostream& os, transfer_status s)
  {
    switch (s)
    {
      case transfer_status::succeeded: return os << "succeeded";
      case transfer_status::skipped:   return os << "skipped";
      case transfer_status::failed:    return os << "failed";
    }
    return os;
  }

  struct transfer_result
  {
    transfer_status status = transfer_status::failed;
    std::uint32_t attempts = 0;
    std::string error; // Last error if failed.
  };

  // Bounded retries with exponential backoff around a single asset
  // transfer.
  //
  // Every attempt first checks the cancellation token and waits for the
  // rate limiter. Errors that are not retryable end the loop right away.
  // Cancellation, whether noticed before, during or after an attempt or in
  // the middle of a backoff sleep, is thrown as operation_cancelled and
  // never reported as a failed transfer.
  //
  // Nothing persistent is touched here: recording the outcome is up to the
  // caller.
  //
  class retry_policy
  {
  public:
    retry_policy (retry_options, rate_limiter&, cancellation_token&);

    retry_policy (const retry_policy&) = delete;
    retry_policy& operator= (const retry_policy&) = delete;

    asio::awaitable<transfer_result>
    run (asset_source&, const asset&, const fs::path& dest);

    // Delay (without jitter) after the specified failed attempt (1-based).
    //
    std::chrono::milliseconds
    backoff (std::uint32_t attempt) const;

    // Random extra delay in [0, max_jitter].
    //
    std::chrono::milliseconds
    jitter ();

    std::uint32_t
    attempts () const noexcept
    {
      return options_.max_attempts == 0 ? 1 : options_.max_attempts;
    }

    const retry_options&
    options () const noexcept
    {
      return options_;
    }

  private:
    retry_options options_;
    rate_limiter& limiter_;
    cancellation_token& token_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
  };
}
