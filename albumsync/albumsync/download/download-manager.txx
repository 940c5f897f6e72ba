#include <utility>
#include <optional>
#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <unordered_set>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <albumsync/albumsync-log.hxx>
#include <albumsync/albumsync-errors.hxx>
#include <albumsync/download/download-path.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

namespace albumsync
{
  template <typename L>
  basic_download_manager<L>::
  basic_download_manager (asset_source& s,
                          ledger_type& l,
                          rate_limiter& r,
                          cancellation_token& t,
                          progress_tracker& p,
                          retry_options o)
    : source_ (s),
      ledger_ (l),
      limiter_ (r),
      token_ (t),
      tracker_ (p),
      retry_ (std::move (o)),
      hash_pool_ (hash_threads ())
  {
  }

  template <typename L>
  asio::awaitable<download_summary> basic_download_manager<L>::
  download_album (const album& al,
                  const fs::path& output,
                  const download_options& o)
  {
    // Resolve the album directory and make sure a hostile album name did not
    // take it somewhere else.
    //
    fs::path root (fs::absolute (output).lexically_normal ());
    fs::path dir (validate_within (root / sanitize_name (al.name), root));

    if (!o.dry_run)
    {
      std::error_code ec;
      fs::create_directories (dir, ec);

      if (ec)
        throw filesystem_error ("unable to create " + dir.string () + ": " +
                                ec.message (),
                                dir.string ());
    }

    retry_options ro (retry_);
    ro.max_attempts = o.max_retries;
    ro.size_limit = o.size_limit;

    retry_policy policy (std::move (ro), limiter_, token_);
    run_state rs (o, al.id, dir, policy);

    rs.summary.album = al.name;
    rs.summary.directory = dir;

    {
      std::vector<std::string> ns (asset_file_names (al.assets));

      for (std::size_t i (0); i != ns.size (); ++i)
        rs.names.emplace (&al.assets[i], std::move (ns[i]));
    }

    if (o.resume_failed_only)
    {
      std::vector<std::string> ids;

      try
      {
        ids = ledger_.failed (al.id);
      }
      catch (const std::exception& e)
      {
        log::warning ("unable to query failed assets of " + al.name + ": " +
                      e.what ());
      }

      std::unordered_set<std::string> want (ids.begin (), ids.end ());

      for (const asset& a: al.assets)
        if (want.count (a.id) != 0)
          rs.items.push_back (&a);

      if (rs.items.empty ())
      {
        log::info ("no failed assets to resume in album " + al.name);
        co_return std::move (rs.summary);
      }
    }
    else
    {
      for (const asset& a: al.assets)
        rs.items.push_back (&a);
    }

    rs.summary.total = rs.items.size ();

    for (const asset* a: rs.items)
      rs.declared += a->size;

    if (rs.declared != 0)
      log::trace ("processing " + std::to_string (rs.items.size ()) +
                  " asset(s) (" + format_size (rs.declared) + ")");
    else
      log::trace ("processing " + std::to_string (rs.items.size ()) +
                  " asset(s)");

    tracker_.reset ();
    report (rs);

    if (!rs.items.empty ())
      co_await run (rs);

    download_summary& s (rs.summary);

    s.attempted = s.downloaded + s.skipped + s.failed;
    s.total_bytes = rs.declared != 0 ? rs.declared : rs.observed;

    co_return std::move (s);
  }

  template <typename L>
  asio::awaitable<void> basic_download_manager<L>::
  run (run_state& rs)
  {
    // One worker per concurrency slot, each pulling the next asset off the
    // shared cursor until there are none left. That the pool is never
    // larger than the bound is all the admission control we need.
    //
    std::size_t n (std::clamp<std::size_t> (rs.options.concurrency,
                                            1,
                                            download_options::max_concurrency));
    n = std::min (n, rs.items.size ());

    auto ex (co_await asio::this_coro::executor);

    using op_type = decltype (
      asio::co_spawn (ex,
                      std::declval<asio::awaitable<void>> (),
                      asio::deferred));

    std::vector<op_type> ops;
    ops.reserve (n);

    for (std::size_t i (0); i != n; ++i)
      ops.push_back (asio::co_spawn (ex, worker (rs), asio::deferred));

    // Wait for all of them even if one is cancelled: the others are about to
    // notice anyway and we don't want to unwind while they still reference
    // the run state.
    //
    auto [ord, exs] =
      co_await asio::experimental::make_parallel_group (std::move (ops))
        .async_wait (asio::experimental::wait_for_all (),
                     asio::use_awaitable);

    for (const std::exception_ptr& e: exs)
    {
      if (!e)
        continue;

      try
      {
        std::rethrow_exception (e);
      }
      catch (const operation_cancelled& c)
      {
        if (!rs.summary.cancelled)
        {
          rs.summary.cancelled = true;
          rs.summary.cancel_reason = c.reason ();
        }
      }
    }
  }

  template <typename L>
  asio::awaitable<void> basic_download_manager<L>::
  worker (run_state& rs)
  {
    for (;;)
    {
      // Once cancelled, nothing new is started.
      //
      token_.throw_if_cancelled ();

      const asset* a;
      {
        std::lock_guard<std::mutex> l (rs.mutex);

        if (rs.next == rs.items.size ())
          co_return;

        a = rs.items[rs.next++];
      }

      std::optional<std::string> e;

      try
      {
        co_await process (rs, *a);
      }
      catch (const operation_cancelled&)
      {
        throw;
      }
      catch (const std::exception& x)
      {
        // Whatever broke while we were shutting down is a consequence of the
        // shutdown.
        //
        if (token_.cancelled ())
          throw operation_cancelled (token_.reason ().value_or ("cancelled"));

        e = x.what ();
      }

      if (e)
        fail (rs, *a, rs.names.at (a), *e);
    }
  }

  template <typename L>
  asio::awaitable<void> basic_download_manager<L>::
  process (run_state& rs, const asset& a)
  {
    const download_options& o (rs.options);

    const std::string& fn (rs.names.at (&a));
    fs::path f (validate_within (rs.dir / fn, rs.dir));

    if (!o.force && co_await present (rs, a, f))
    {
      std::error_code ec;
      std::uint64_t n (fs::file_size (f, ec));

      if (ec)
        n = a.size;

      {
        std::lock_guard<std::mutex> l (rs.mutex);

        ++rs.summary.skipped;
        rs.summary.skipped_bytes += n;

        if (rs.declared == 0)
          rs.observed += n;
      }

      log::trace ("present: " + fn);
      report (rs);
      co_return;
    }

    token_.throw_if_cancelled ();

    if (o.dry_run)
    {
      log::info ("dry run: would download " + fn + " to " + f.string ());

      {
        std::lock_guard<std::mutex> l (rs.mutex);

        ++rs.summary.downloaded;
        rs.summary.transferred_bytes += a.size;

        if (rs.declared == 0)
          rs.observed += a.size;
      }

      report (rs);
      co_return;
    }

    log::trace ("downloading " + fn);

    transfer_result r (co_await rs.policy.run (source_, a, f));

    switch (r.status)
    {
    case transfer_status::succeeded:
      {
        // Account for what actually landed on disk rather than what the
        // server claimed.
        //
        std::error_code ec;
        std::uint64_t n (fs::file_size (f, ec));

        if (ec)
          n = a.size;

        {
          std::lock_guard<std::mutex> l (rs.mutex);

          ++rs.summary.downloaded;
          rs.summary.transferred_bytes += n;

          if (rs.declared == 0)
            rs.observed += n;
        }

        try
        {
          ledger_.record_downloaded (a.id,
                                     rs.album_id,
                                     a.checksum,
                                     rs.dir.string ());
        }
        catch (const std::exception& e)
        {
          log::error ("unable to record " + fn + " as downloaded: " +
                      e.what ());
        }

        if (r.attempts > 1)
          log::trace ("downloaded " + fn + " after " +
                      std::to_string (r.attempts) + " attempts");
        break;
      }
    case transfer_status::skipped:
      {
        log::trace ("over the size limit: " + fn + " (" +
                    format_size (a.size) + ")");

        std::lock_guard<std::mutex> l (rs.mutex);

        ++rs.summary.skipped;
        rs.summary.skipped_bytes += a.size;
        break;
      }
    case transfer_status::failed:
      {
        fail (rs, a, fn, r.error);
        co_return;
      }
    }

    report (rs);
  }

  template <typename L>
  std::size_t basic_download_manager<L>::
  hash_threads ()
  {
    // Reading the file dominates, a couple of threads keep up with the
    // workers.
    //
    std::size_t n (std::thread::hardware_concurrency ());

    if (n == 0)
      n = 4;

    return std::min<std::size_t> (n, 4);
  }

  template <typename L>
  asio::awaitable<bool> basic_download_manager<L>::
  present (run_state& rs, const asset& a, const fs::path& f)
  {
    std::error_code ec;
    std::uint64_t n (fs::file_size (f, ec));

    if (ec || n == 0)
      co_return false;

    // Resumes on our executor since the completion goes through the
    // awaitable's executor.
    //
    bool m (co_await asio::co_spawn (
      hash_pool_,
      [f, cs = a.checksum] () -> asio::awaitable<bool>
      {
        co_return checksum_matches (f, cs);
      },
      asio::use_awaitable));

    if (!m)
      co_return false;

    // A dry run reads the ledger but does not write to it.
    //
    try
    {
      std::string d (rs.dir.string ());

      if (!ledger_.is_downloaded (a.id, rs.album_id, a.checksum, d) &&
          !rs.options.dry_run)
        ledger_.record_downloaded (a.id, rs.album_id, a.checksum, d);

      co_return true;
    }
    catch (const std::exception& e)
    {
      log::error ("ledger unavailable for " + a.id + ", downloading again: " +
                  e.what ());
      co_return false;
    }
  }

  template <typename L>
  void basic_download_manager<L>::
  fail (run_state& rs,
        const asset& a,
        const std::string& fn,
        const std::string& e)
  {
    std::size_t n;
    {
      std::lock_guard<std::mutex> l (rs.mutex);

      ++rs.summary.failed;
      rs.summary.add_failure (failed_item (fn, a.id, e));
      n = rs.summary.failed;
    }

    // Past the first few, the summary is a better place for them.
    //
    if (rs.options.verbose || n <= 10)
      log::error ("failed: " + fn + ": " + e);

    try
    {
      ledger_.record_failed (a.id, rs.album_id, e);
    }
    catch (const std::exception& x)
    {
      log::error ("unable to record " + fn + " as failed: " + x.what ());
    }

    report (rs);
  }

  template <typename L>
  void basic_download_manager<L>::
  report (run_state& rs)
  {
    progress_stats st;
    std::size_t total;
    {
      std::lock_guard<std::mutex> l (rs.mutex);

      const download_summary& s (rs.summary);

      st.downloaded = s.downloaded;
      st.skipped = s.skipped;
      st.failed = s.failed;
      st.transferred_bytes = s.transferred_bytes + s.skipped_bytes;
      st.declared_bytes = rs.declared;
      st.observed_bytes = rs.observed;
      total = s.total;
    }

    tracker_.update (st.attempted (), total, st);
  }
}
