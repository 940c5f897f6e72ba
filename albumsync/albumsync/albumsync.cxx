#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <exception>
#include <filesystem>

#include <unistd.h> // isatty(), _exit()

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <albumsync/albumsync-log.hxx>
#include <albumsync/albumsync-config.hxx>
#include <albumsync/albumsync-errors.hxx>
#include <albumsync/albumsync-select.hxx>
#include <albumsync/albumsync-options.hxx>
#include <albumsync/cancel/cancellation-token.hxx>
#include <albumsync/throttle/rate-limiter.hxx>
#include <albumsync/ledger/ledger-database.hxx>
#include <albumsync/progress/progress-tracker.hxx>
#include <albumsync/progress/progress-renderer.hxx>
#include <albumsync/download/download-path.hxx>
#include <albumsync/download/download-types.hxx>
#include <albumsync/download/download-manager.hxx>
#include <albumsync/immich/immich-api.hxx>

#include <albumsync/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace albumsync
{
  // Exit status of an interrupted run (128 + SIGINT, as shells report it).
  //
  static const int cancelled_exit (130);

  static bool
  maintenance (const options& o)
  {
    return o.cleanup_db_specified () ||
           o.backup_db_specified ()  ||
           o.restore_db_specified () ||
           o.list_backups ();
  }

  // Run the requested ledger maintenance and return the exit status.
  //
  // Only one operation is performed per invocation, in the order restore,
  // backup, cleanup, list. Restoring first means a backup of the restored
  // state can be taken with a second invocation but never the other way
  // around by accident.
  //
  static int
  maintain_ledger (const options& o, const configuration& c)
  {
    ledger_database db (c.cache_dir);

    if (o.restore_db_specified ())
    {
      fs::path s (expand_path (o.restore_db ()));
      fs::path p (db.restore (s));

      log::info ("restored ledger from " + s.string ());
      log::info ("previous ledger saved as " + p.string ());
      return 0;
    }

    if (o.backup_db_specified ())
    {
      fs::path p (db.backup (o.backup_db ().empty ()
                             ? fs::path ()
                             : expand_path (o.backup_db ())));

      log::info ("ledger backed up to " + p.string ());
      return 0;
    }

    if (o.cleanup_db_specified ())
    {
      bool only_failed (!o.cleanup_db_all ());
      size_t before (db.count ());
      size_t n (db.purge (o.cleanup_db (), only_failed));

      log::info ("removed " + std::to_string (n) + " of " +
                 std::to_string (before) + (only_failed ? " failed" : "") +
                 " ledger entries older than " +
                 std::to_string (o.cleanup_db ()) + " days");

      if (n != 0)
        db.vacuum ();

      if (!db.check ())
        log::warning ("ledger integrity check failed, consider restoring a "
                      "backup");

      return 0;
    }

    // --list-backups
    //
    vector<ledger_backup> bs (db.backups ());

    if (bs.empty ())
    {
      log::info ("no backups in " + db.backup_directory ().string ());
      return 0;
    }

    for (const ledger_backup& b: bs)
      cout << b.path.string () << " (" << format_size (b.size) << ')' << '\n';

    return 0;
  }

  // Everything that needs the server.
  //
  class application
  {
  public:
    application (asio::io_context& ioc,
                 const options& o,
                 const configuration& c)
        : options_ (o),
          config_ (c),
          limiter_ (c.rate_limit_requests, c.rate_limit_window),
          api_ (ioc,
                immich_options {c.base_url,
                                c.api_key,
                                c.ssl_verify,
                                string ("albumsync/") + ALBUMSYNC_VERSION_ID},
                limiter_,
                token_),
          signals_ (ioc, SIGINT, SIGTERM),
          renderer_ (cout, !o.no_progress () && ::isatty (STDOUT_FILENO)),
          tracker_ ([this] (const progress_snapshot& s) {renderer_.render (s);})
    {
    }

    asio::awaitable<int>
    health ()
    {
      co_return (co_await api_.check_health ()) ? 0 : 1;
    }

    asio::awaitable<int>
    run ();

    void
    unwatch_signals ()
    {
      boost::system::error_code ec;
      signals_.cancel (ec);
    }

    bool
    cancelled () const
    {
      return token_.cancelled ();
    }

  private:
    // First signal cancels the run, the second one gives up on a graceful
    // shutdown.
    //
    void
    watch_signals ();

    download_options
    download_settings () const;

    optional<vector<album>>
    select (vector<album>);

  private:
    const options& options_;
    const configuration& config_;

    cancellation_token token_;
    rate_limiter limiter_;
    immich_api api_;
    asio::signal_set signals_;

    progress_renderer renderer_;
    progress_tracker tracker_;

    optional<ledger_database> ledger_;
  };

  void application::
  watch_signals ()
  {
    signals_.async_wait (
      [this] (const boost::system::error_code& ec, int s)
      {
        if (ec)
          return;

        string n (s == SIGINT ? "SIGINT" : "SIGTERM");

        if (token_.cancel ("Interrupted by " + n))
        {
          renderer_.finish ();
          cerr << "interrupted by " << n << ", finishing in-flight transfers "
               << "(press Ctrl-C again to exit immediately)" << endl;

          watch_signals ();
          return;
        }

        // Second signal. Get the ledger into a consistent state on disk and
        // leave without unwinding.
        //
        if (ledger_)
        {
          try
          {
            ledger_->close ();
          }
          catch (const exception& e)
          {
            cerr << "error: unable to close ledger: " << e.what () << endl;
          }
        }

        log::close ();
        ::_exit (cancelled_exit);
      });
  }

  download_options application::
  download_settings () const
  {
    const options& o (options_);

    download_options r;
    r.force = o.force ();
    r.resume_failed_only = o.resume_failed ();
    r.dry_run = o.dry_run ();
    r.verbose = log::verbose ();

    r.concurrency = o.concurrency_specified ()
      ? checked_concurrency (o.concurrency ())
      : config_.concurrency;

    r.max_retries = o.max_retries_specified ()
      ? checked_max_retries (o.max_retries ())
      : config_.max_retries;

    if (o.limit_size_specified ())
    {
      if (o.limit_size () == 0)
        throw validation_error ("size limit must be at least 1 MiB",
                                "limit-size");

      r.size_limit = o.limit_size () * 1024 * 1024;
    }

    return r;
  }

  optional<vector<album>> application::
  select (vector<album> as)
  {
    sort_albums (as);

    album_filter f;
    f.all = options_.all ();

    if (options_.only_specified ())
      f.only = options_.only ();

    if (options_.exclude_specified ())
      f.exclude = options_.exclude ();

    if (f.unattended ())
      return filter_albums (as, f);

    cout << "found " << as.size () << " album(s):" << '\n';
    return prompt_albums (as, cin, cout);
  }

  asio::awaitable<int> application::
  run ()
  {
    // Validate the command line before talking to the server.
    //
    download_options dopt (download_settings ());

    fs::path out (options_.output_specified ()
                  ? expand_path (options_.output ())
                  : config_.default_output);

    if (dopt.dry_run && dopt.resume_failed_only)
      log::warning ("--resume-failed has no effect with --dry-run, nothing "
                    "will be resumed");

    if (dopt.dry_run)
      log::info ("dry run: nothing will be downloaded or recorded");

    ledger_.emplace (config_.cache_dir);
    log::trace ("using ledger " + ledger_->path ().string ());

    vector<album> all (co_await api_.list_albums ());

    if (all.empty ())
    {
      log::info ("no albums found on " + config_.base_url);
      co_return 0;
    }

    optional<vector<album>> sel (select (move (all)));

    if (!sel)
    {
      cerr << "error: no albums selected" << endl;
      co_return 1;
    }

    if (sel->empty ())
    {
      log::warning ("no albums match the selection");
      co_return 0;
    }

    // Only now: the default disposition is what we want while the prompt
    // blocks on standard input.
    //
    watch_signals ();

    retry_options ro;
    ro.timeout = config_.download_timeout;

    download_manager dm (api_, *ledger_, limiter_, token_, tracker_, ro);

    bool failed (false);

    for (album& a: *sel)
    {
      if (token_.cancelled ())
        break;

      try
      {
        a.assets = co_await api_.list_assets (a.id);
      }
      catch (const operation_cancelled&)
      {
        break;
      }
      catch (const error& e)
      {
        log::error ("unable to list assets of album " + a.name + ": " +
                    e.what ());
        failed = true;
        continue;
      }

      if (a.assets.empty ())
      {
        log::warning ("album " + a.name + " is empty, skipping");
        continue;
      }

      log::info ("album " + a.name + ": " +
                 std::to_string (a.assets.size ()) + " item(s)");

      tracker_.reset ();
      renderer_.label (a.name);

      download_summary s;

      try
      {
        s = co_await dm.download_album (a, out, dopt);
      }
      catch (const error& e)
      {
        // Album directory unusable (outside of output or not creatable).
        //
        renderer_.finish ();
        log::error ("unable to download album " + a.name + ": " + e.what ());
        failed = true;
        continue;
      }

      renderer_.finish ();
      print_summary (cout, s, dopt.verbose);

      if (s.failed != 0)
        failed = true;

      if (s.cancelled)
        break;
    }

    if (token_.cancelled ())
    {
      log::warning (*token_.reason ());
      co_return cancelled_exit;
    }

    // Failed items are reported in the summaries and can be retried with
    // --resume-failed. They do not make the run itself unsuccessful.
    //
    if (failed)
      log::trace ("some items failed, rerun with --resume-failed to retry");

    co_return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace albumsync;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "albumsync " << ALBUMSYNC_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: albumsync [options]" << "\n"
        << "options:"                   << "\n";

      opt.print_usage (o);

      return 0;
    }

    // Configuration. The .env file never overrides the real environment.
    //
    load_env_file (".env");
    configuration cfg (load_configuration ());

    if (opt.cache_dir_specified ())
      cfg.cache_dir = expand_path (opt.cache_dir ());

    log::verbose (opt.verbose () || opt.dry_run ());
    log::open (cfg.cache_dir / "albumsync.log");

    // Ledger maintenance does not need the server.
    //
    if (maintenance (opt))
      return maintain_ledger (opt, cfg);

    asio::io_context ioc;
    application app (ioc, opt, cfg);

    int exit_code (0);

    auto done ([&exit_code, &ioc, &app] (exception_ptr ex, int r)
    {
      exit_code = r;

      if (ex)
      {
        try { rethrow_exception (ex); }
        catch (const operation_cancelled& e)
        {
          log::warning (e.what ());
          exit_code = cancelled_exit;
        }
        catch (const configuration_error& e)
        {
          log::error (e.what ());
          exit_code = 1;
        }
        catch (const validation_error& e)
        {
          log::error (e.what ());
          exit_code = 1;
        }
        catch (const exception& e)
        {
          log::error (e.what ());
          exit_code = app.cancelled () ? cancelled_exit : 1;
        }
      }

      app.unwatch_signals ();
      ioc.stop ();
    });

    if (opt.health ())
      asio::co_spawn (ioc, app.health (), done);
    else
      asio::co_spawn (ioc, app.run (), done);

    ioc.run ();
    log::close ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    log::error (ex.what ());
    log::close ();
    return 1;
  }
}
