#pragma once

#include <albumsync/ledger/ledger-types.hxx>

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <odb/database.hxx>
#include <odb/transaction.hxx>
#include <odb/schema-catalog.hxx>
#include <odb/sqlite/database.hxx>

namespace albumsync
{
  namespace fs = std::filesystem;

  template <typename S = std::string>
  struct ledger_database_traits
  {
    using string_type = S;
    using database_type = odb::sqlite::database;

    static constexpr const char* db_name = "downloads.db";
    static constexpr const char* backup_dir = "backups";

    // Prefix and extension of automatically named backups. The timestamp in
    // between (YYYYMMDD-HHMMSS) sorts lexicographically.
    //
    static constexpr const char* backup_prefix = "downloads-";
    static constexpr const char* restore_prefix = "pre-restore-";
    static constexpr const char* backup_ext = ".db";

    // Failure text is kept for the summary of a later resume run, not as a
    // log, so a few hundred bytes is plenty.
    //
    static constexpr std::size_t max_error = 500;

    // How long a writer waits for the write lock held by another
    // connection (ours or another process's) before giving up.
    //
    static constexpr int busy_timeout = 5000; // Milliseconds.

    // Transfers record outcomes while the user may be inspecting the file
    // with the sqlite3 shell, so don't block readers.
    //
    static constexpr bool wal = true;
  };

  // Backup artifact as found on disk.
  //
  struct ledger_backup
  {
    fs::path path;
    std::uint64_t size = 0;
    fs::file_time_type modified;
  };

  // Durable record of per-asset outcomes.
  //
  // Every write is its own IMMEDIATE transaction that upserts a single row.
  // The write lock is taken before the row is looked up, so concurrent
  // writers (even for the same asset) queue up on SQLite's lock rather than
  // race, and the last one to commit is what the ledger holds.
  //
  template <typename T = ledger_database_traits<>>
  class basic_ledger_database
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using database_type = typename traits_type::database_type;

    // Open (creating if necessary) the ledger in the specified directory.
    //
    explicit
    basic_ledger_database (const fs::path& dir);

    basic_ledger_database (const basic_ledger_database&) = delete;
    basic_ledger_database& operator= (const basic_ledger_database&) = delete;

    ~basic_ledger_database ();

    bool
    is_open () const noexcept;

    const fs::path&
    path () const noexcept;

    fs::path
    backup_directory () const;

    // Queries.
    //

    // True if the asset was downloaded under this album with exactly this
    // checksum into exactly this directory. Any failure to look it up reads
    // as "not downloaded" (and is reported as a warning): the worst outcome
    // is a redundant transfer.
    //
    bool
    is_downloaded (const string_type& asset,
                   const string_type& album,
                   const string_type& checksum,
                   const string_type& dir) const;

    std::optional<ledger_entry>
    find (const string_type& asset) const;

    // Failed assets of the album, most recently recorded first.
    //
    std::vector<string_type>
    failed (const string_type& album) const;

    std::size_t
    count () const;

    std::size_t
    count (ledger_status) const;

    // Updates.
    //

    void
    record_downloaded (const string_type& asset,
                       const string_type& album,
                       const string_type& checksum,
                       const string_type& dir);

    void
    record_failed (const string_type& asset,
                   const string_type& album,
                   const string_type& error);

    // Retention.
    //

    // Remove entries recorded more than `days` days ago, only failed ones if
    // requested, optionally restricted to one album. All or nothing. Return
    // the number of entries removed.
    //
    std::size_t
    purge (unsigned int days,
           bool only_failed,
           const std::optional<string_type>& album = std::nullopt);

    // Backup and restore.
    //

    // Write a point-in-time copy using the SQLite online backup API. An
    // empty destination or one ending with a directory separator gets an
    // automatically named file (in the backup directory for the empty case).
    // Return the path actually written.
    //
    fs::path
    backup (const fs::path& dest = fs::path ());

    // Backups in the directory (the backup directory by default), newest
    // first.
    //
    std::vector<ledger_backup>
    backups (const fs::path& dir = fs::path ()) const;

    // Replace the live ledger with the specified backup. The current ledger
    // is first saved as a pre-restore backup (returned). Whatever happens,
    // the ledger is reopened before returning or throwing.
    //
    fs::path
    restore (const fs::path& src);

    // Maintenance.
    //

    void
    vacuum ();

    // Run 'PRAGMA integrity_check'.
    //
    bool
    check () const;

    // Release the database (flushing the WAL). Further calls other than
    // open() or close() throw ledger_error.
    //
    void
    close ();

    void
    open ();

  private:
    void
    init ();

    void
    schema ();

    void
    pragmas ();

    database_type&
    db () const;

    // Start a write transaction on a connection that waits for the lock.
    //
    odb::transaction_impl*
    begin_write ();

    // Stamped once the write lock is held.
    //
    void
    upsert (ledger_entry&&);

    // Milliseconds since epoch, strictly increasing within the process so
    // that "most recent first" is well defined even for writes within the
    // same millisecond.
    //
    static std::int64_t
    stamp ();

    fs::path dir_;
    fs::path path_;
    std::unique_ptr<database_type> db_;
  };

  using ledger_database = basic_ledger_database<>;

  // Format a time point as YYYYMMDD-HHMMSS (local time).
  //
  std::string
  backup_timestamp (std::chrono::system_clock::time_point =
                      std::chrono::system_clock::now ());
}

#include <albumsync/ledger/ledger-database.ixx>
#include <albumsync/ledger/ledger-database.txx>
