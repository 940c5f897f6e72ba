#include <albumsync/download/download-retry.hxx>

#include <cassert>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <exception>

#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/throttle/rate-limiter.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

using namespace std;
using namespace std::chrono;
using namespace albumsync;

namespace asio = boost::asio;

// Source that fails a scripted number of times before succeeding.
//
class scripted_source: public asset_source
{
public:
  enum class kind {network, not_found, generic};

  explicit
  scripted_source (size_t failures, kind k = kind::network)
    : failures_ (failures), kind_ (k) {}

  asio::awaitable<void>
  fetch (const asset&,
         const fs::path&,
         milliseconds timeout,
         cancellation_token& ct) override
  {
    ++calls;
    last_timeout = timeout;
    ct.throw_if_cancelled ();

    if (calls <= failures_)
    {
      switch (kind_)
      {
        case kind::network:   throw network_error ("connection reset");
        case kind::not_found: throw api_error ("not found", 404, "/api/x");
        case kind::generic:   throw runtime_error ("disk full");
      }
    }

    co_return;
  }

  size_t calls = 0;
  milliseconds last_timeout {0};

private:
  size_t failures_;
  kind kind_;
};

static retry_options
quick (uint32_t attempts)
{
  retry_options o;
  o.max_attempts = attempts;
  o.base_delay = milliseconds (5);
  o.max_delay = milliseconds (20);
  o.max_jitter = milliseconds (1);
  o.timeout = milliseconds (1234);
  return o;
}

static asset
item (uint64_t size = 100)
{
  asset a;
  a.id = "a1";
  a.album_id = "al";
  a.name = "a.jpg";
  a.size = size;
  return a;
}

// Run the policy to completion. Return nullopt if it threw
// operation_cancelled.
//
static optional<transfer_result>
run (retry_policy& p, asset_source& s, const asset& a)
{
  asio::io_context ioc;
  optional<transfer_result> r;
  bool cancelled (false);

  fs::path d ("unused");

  asio::co_spawn (
    ioc,
    p.run (s, a, d),
    [&r, &cancelled] (exception_ptr e, transfer_result v)
    {
      if (!e)
      {
        r = v;
        return;
      }

      try
      {
        rethrow_exception (e);
      }
      catch (const operation_cancelled&)
      {
        cancelled = true;
      }
    });

  ioc.run ();
  assert (r || cancelled);
  return r;
}

static void
test_backoff ()
{
  rate_limiter rl;
  cancellation_token ct;
  retry_policy p (retry_options (), rl, ct);

  assert (p.backoff (1) == milliseconds (1000));
  assert (p.backoff (2) == milliseconds (2000));
  assert (p.backoff (3) == milliseconds (4000));
  assert (p.backoff (4) == milliseconds (8000));
  assert (p.backoff (5) == milliseconds (10000));
  assert (p.backoff (6) == milliseconds (10000));
  assert (p.backoff (64) == milliseconds (10000));

  for (uint32_t i (1); i < 40; ++i)
    assert (p.backoff (i) <= p.backoff (i + 1));

  for (int i (0); i < 100; ++i)
  {
    milliseconds j (p.jitter ());
    assert (j >= milliseconds (0) && j <= milliseconds (500));
  }
}

static void
test_eventual_success ()
{
  rate_limiter rl (100);
  cancellation_token ct;
  retry_policy p (quick (3), rl, ct);
  scripted_source s (2);

  optional<transfer_result> r (run (p, s, item ()));

  assert (r->status == transfer_status::succeeded);
  assert (r->attempts == 3);
  assert (r->error.empty ());
  assert (s.calls == 3);
  assert (s.last_timeout == milliseconds (1234));
}

// A permanently failing source is called exactly max_attempts times.
//
static void
test_bound ()
{
  for (uint32_t n: {1u, 2u, 4u})
  {
    rate_limiter rl (100);
    cancellation_token ct;
    retry_policy p (quick (n), rl, ct);
    scripted_source s (100);

    optional<transfer_result> r (run (p, s, item ()));

    assert (r->status == transfer_status::failed);
    assert (r->attempts == n);
    assert (r->error == "connection reset");
    assert (s.calls == n);
  }

  // Zero means a single attempt.
  //
  rate_limiter rl (100);
  cancellation_token ct;
  retry_policy p (quick (0), rl, ct);
  scripted_source s (100, scripted_source::kind::generic);

  optional<transfer_result> r (run (p, s, item ()));
  assert (r->status == transfer_status::failed);
  assert (r->error == "disk full");
  assert (s.calls == 1);
}

// Client errors other than 408/429 are not worth repeating.
//
static void
test_not_retryable ()
{
  rate_limiter rl (100);
  cancellation_token ct;
  retry_policy p (quick (5), rl, ct);
  scripted_source s (100, scripted_source::kind::not_found);

  optional<transfer_result> r (run (p, s, item ()));

  assert (r->status == transfer_status::failed);
  assert (r->attempts == 1);
  assert (s.calls == 1);
}

static void
test_size_limit ()
{
  rate_limiter rl;
  cancellation_token ct;

  retry_options o (quick (3));
  o.size_limit = 50 * 1024 * 1024;

  retry_policy p (o, rl, ct);
  scripted_source s (0);

  optional<transfer_result> r (run (p, s, item (200 * 1024 * 1024)));
  assert (r->status == transfer_status::skipped);
  assert (r->attempts == 0);
  assert (s.calls == 0);

  r = run (p, s, item (1024 * 1024));
  assert (r->status == transfer_status::succeeded);
  assert (s.calls == 1);
}

static void
test_cancelled_before ()
{
  rate_limiter rl;
  cancellation_token ct;
  retry_policy p (quick (3), rl, ct);
  scripted_source s (0);

  ct.cancel ("stop");

  assert (!run (p, s, item ()));
  assert (s.calls == 0);
}

// Cancelling during a long backoff sleep ends it early and is reported as a
// cancellation, not a failure.
//
static void
test_cancelled_backoff ()
{
  rate_limiter rl (100);
  cancellation_token ct;

  retry_options o (quick (3));
  o.base_delay = milliseconds (5000);
  o.max_delay = milliseconds (5000);

  retry_policy p (o, rl, ct);
  scripted_source s (100);

  asio::io_context ioc;
  bool cancelled (false);

  asset a (item ());
  fs::path d ("unused");

  asio::co_spawn (
    ioc,
    p.run (s, a, d),
    [&cancelled] (exception_ptr e, transfer_result)
    {
      try
      {
        if (e)
          rethrow_exception (e);
      }
      catch (const operation_cancelled& x)
      {
        cancelled = (x.reason () == "Interrupted");
      }
    });

  asio::steady_timer t (ioc, milliseconds (50));
  t.async_wait ([&ct] (const boost::system::error_code&)
                {
                  ct.cancel ("Interrupted");
                });

  auto start (steady_clock::now ());
  ioc.run ();

  assert (cancelled);
  assert (s.calls == 1);
  assert (steady_clock::now () - start < milliseconds (2000));
}

int
main ()
{
  test_backoff ();
  test_eventual_success ();
  test_bound ();
  test_not_retryable ();
  test_size_limit ();
  test_cancelled_before ();
  test_cancelled_backoff ();
}
