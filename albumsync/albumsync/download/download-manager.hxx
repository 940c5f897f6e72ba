#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <unordered_map>
#include <filesystem>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include <albumsync/download/download-types.hxx>
#include <albumsync/download/download-retry.hxx>
#include <albumsync/ledger/ledger-database.hxx>
#include <albumsync/progress/progress-tracker.hxx>

namespace albumsync
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  class rate_limiter;
  class cancellation_token;

  // Album download orchestrator.
  //
  // For one album: decides for every asset whether it is already present
  // (skip), merely simulated (dry run) or has to be transferred, runs the
  // transfers through the retry policy on a bounded number of worker
  // coroutines, records every terminal outcome in the ledger, feeds the
  // progress tracker and returns the summary.
  //
  // Per-asset errors never unwind the run: they become failed outcomes.
  // Ledger errors are reported and otherwise ignored (an asset whose ledger
  // state cannot be established is simply transferred again). Cancellation
  // stops new assets from being picked up, aborts the in-flight ones without
  // recording them as failed, and is reported in the summary.
  //
  // The ledger is a template parameter so that tests can substitute one that
  // misbehaves.
  //
  template <typename L = ledger_database>
  class basic_download_manager
  {
  public:
    using ledger_type = L;

    // The retry options are the defaults for every album; the attempt count
    // and size limit are then taken from the per-album download options.
    //
    basic_download_manager (asset_source&,
                            ledger_type&,
                            rate_limiter&,
                            cancellation_token&,
                            progress_tracker&,
                            retry_options = retry_options ());

    basic_download_manager (const basic_download_manager&) = delete;
    basic_download_manager& operator= (const basic_download_manager&) = delete;

    // Download the album's assets into <output>/<sanitized album name>.
    //
    // Throw path_traversal_error if the album directory would end up outside
    // of output and filesystem_error if it cannot be created. Everything
    // else ends up in the summary.
    //
    asio::awaitable<download_summary>
    download_album (const album&,
                    const fs::path& output,
                    const download_options&);

    const retry_options&
    retry () const noexcept
    {
      return retry_;
    }

  private:
    struct run_state
    {
      run_state (const download_options& o,
                 std::string id,
                 fs::path d,
                 retry_policy& p)
        : options (o), album_id (std::move (id)), dir (std::move (d)),
          policy (p) {}

      const download_options& options;
      const std::string album_id;
      const fs::path dir;
      retry_policy& policy;

      std::vector<const asset*> items;

      // Local file name of each asset of the album, fixed before any worker
      // starts.
      //
      std::unordered_map<const asset*, std::string> names;

      // Everything below is guarded by the mutex.
      //
      std::mutex mutex;
      std::size_t next = 0;
      download_summary summary;
      std::uint64_t declared = 0; // Sum of declared sizes (fixed up front).
      std::uint64_t observed = 0; // Measured sizes, when nothing is declared.
    };

    // Run the workers to completion, noting a cancellation in the summary.
    //
    asio::awaitable<void>
    run (run_state&);

    asio::awaitable<void>
    worker (run_state&);

    asio::awaitable<void>
    process (run_state&, const asset&);

    // Whether a matching copy is already on disk. Bring the ledger up to date
    // if it did not know about it.
    //
    // The checksum is computed on the hashing pool and the coroutine resumes
    // on its own executor before touching the ledger.
    //
    asio::awaitable<bool>
    present (run_state&, const asset&, const fs::path&);

    void
    fail (run_state&,
          const asset&,
          const std::string& name,
          const std::string& error);

    void
    report (run_state&);

    static std::size_t
    hash_threads ();

  private:
    asset_source& source_;
    ledger_type& ledger_;
    rate_limiter& limiter_;
    cancellation_token& token_;
    progress_tracker& tracker_;
    retry_options retry_;

    // Hashing existing files must not stall the transfers sharing the
    // io_context.
    //
    asio::thread_pool hash_pool_;
  };

  using download_manager = basic_download_manager<>;
}

#include <albumsync/download/download-manager.txx>
