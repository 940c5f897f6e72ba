#include <mutex>
#include <algorithm>
#include <string>
#include <system_error>

#include <sqlite3.h>

#include <odb/query.hxx>
#include <odb/result.hxx>
#include <odb/exceptions.hxx>
#include <odb/sqlite/connection.hxx>

#include <albumsync/albumsync-log.hxx>

// Include ODB-generated headers.
//
#include <albumsync/ledger/ledger-types-odb.hxx>

namespace albumsync
{
  template <typename T>
  basic_ledger_database<T>::
  basic_ledger_database (const fs::path& d)
    : dir_ (d), path_ (d / traits_type::db_name)
  {
    init ();
  }

  template <typename T>
  basic_ledger_database<T>::
  ~basic_ledger_database ()
  {
  }

  template <typename T>
  void basic_ledger_database<T>::
  init ()
  {
    std::error_code ec;
    fs::create_directories (dir_, ec);

    if (ec)
      throw ledger_error ("unable to create ledger directory " +
                          dir_.string () + ": " + ec.message (),
                          "open");

    try
    {
      db_ = std::make_unique<database_type> (
        path_.string (),
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

      pragmas ();
      schema ();
    }
    catch (const odb::exception& e)
    {
      db_.reset ();
      throw ledger_error ("unable to open ledger " + path_.string () + ": " +
                          e.what (),
                          "open");
    }
  }

  template <typename T>
  void basic_ledger_database<T>::
  schema ()
  {
    // create_schema() has no "if not exists" mode, so look for the table
    // ourselves first. It may well be there: the file could be a restored
    // backup.
    //
    bool exists (false);
    {
      odb::transaction t (db_->begin ());

      odb::sqlite::connection& c (
        static_cast<odb::sqlite::connection&> (t.connection ()));

      sqlite3_stmt* s (nullptr);
      const char* q (
        "SELECT name FROM sqlite_master WHERE type='table' AND name='downloads'");

      if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) == SQLITE_OK)
      {
        if (sqlite3_step (s) == SQLITE_ROW)
          exists = true;
        sqlite3_finalize (s);
      }

      t.commit ();
    }

    if (!exists)
    {
      odb::transaction t (db_->begin ());
      odb::schema_catalog::create_schema (*db_);
      t.commit ();
    }
  }

  template <typename T>
  void basic_ledger_database<T>::
  pragmas ()
  {
    // Journal mode can't be changed inside a transaction, which is what
    // ODB's execute() would wrap us in. So go straight to the handle.
    //
    odb::connection_ptr c (db_->connection ());
    sqlite3* h (static_cast<odb::sqlite::connection&> (*c).handle ());

    if (traits_type::wal)
      sqlite3_exec (h, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);

    // NORMAL is durable enough in WAL mode: we may lose the last outcome on
    // power loss, never the file.
    //
    sqlite3_exec (h, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec (h, "PRAGMA busy_timeout=5000", nullptr, nullptr, nullptr);
    sqlite3_exec (h, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);
  }

  template <typename T>
  std::int64_t basic_ledger_database<T>::
  stamp ()
  {
    using namespace std::chrono;

    std::int64_t n (duration_cast<milliseconds> (
                      system_clock::now ().time_since_epoch ()).count ());

    // Shared by every handle in the process.
    //
    static std::mutex m;
    static std::int64_t last (0);

    std::lock_guard<std::mutex> l (m);

    if (n <= last)
      n = last + 1;

    last = n;
    return n;
  }

  template <typename T>
  std::optional<ledger_entry> basic_ledger_database<T>::
  find (const string_type& a) const
  {
    try
    {
      odb::transaction t (db ().begin ());
      std::shared_ptr<ledger_entry> e (db ().template find<ledger_entry> (a));
      t.commit ();

      return e ? std::optional<ledger_entry> (*e) : std::nullopt;
    }
    catch (const odb::exception& e)
    {
      throw ledger_error (std::string ("lookup failed: ") + e.what (), "find");
    }
  }

  template <typename T>
  bool basic_ledger_database<T>::
  is_downloaded (const string_type& a,
                 const string_type& al,
                 const string_type& cs,
                 const string_type& d) const
  {
    try
    {
      std::optional<ledger_entry> e (find (a));

      return e &&
             e->album_id () == al &&
             e->status () == ledger_status::downloaded &&
             e->checksum () == cs &&
             e->target_dir () == d;
    }
    catch (const std::exception& e)
    {
      log::warning (std::string ("ledger lookup for asset ") + a +
                    " failed: " + e.what ());
      return false;
    }
  }

  template <typename T>
  std::vector<typename basic_ledger_database<T>::string_type>
  basic_ledger_database<T>::
  failed (const string_type& al) const
  {
    using query = odb::query<ledger_entry>;

    std::vector<string_type> r;

    try
    {
      odb::transaction t (db ().begin ());

      odb::result<ledger_entry> res (
        db ().template query<ledger_entry> (
          (query::album_id == al && query::status == ledger_status::failed) +
          "ORDER BY" + query::recorded_at + "DESC"));

      for (auto& e: res)
        r.push_back (e.asset_id ());

      t.commit ();
    }
    catch (const odb::exception& e)
    {
      throw ledger_error (std::string ("failed asset query: ") + e.what (),
                          "failed");
    }

    return r;
  }

  template <typename T>
  std::size_t basic_ledger_database<T>::
  count () const
  {
    odb::transaction t (db ().begin ());
    odb::result<ledger_entry> r (db ().template query<ledger_entry> ());

    std::size_t n (0);
    for (auto i (r.begin ()); i != r.end (); ++i)
      ++n;

    t.commit ();
    return n;
  }

  template <typename T>
  std::size_t basic_ledger_database<T>::
  count (ledger_status s) const
  {
    using query = odb::query<ledger_entry>;

    odb::transaction t (db ().begin ());
    odb::result<ledger_entry> r (
      db ().template query<ledger_entry> (query::status == s));

    std::size_t n (0);
    for (auto i (r.begin ()); i != r.end (); ++i)
      ++n;

    t.commit ();
    return n;
  }

  template <typename T>
  odb::transaction_impl* basic_ledger_database<T>::
  begin_write ()
  {
    // The busy timeout is per connection and the pool hands out several, so
    // set it on the one we are about to use. With a deferred BEGIN two
    // writers could both read and then collide on the upgrade to a write
    // lock (SQLITE_BUSY without waiting), hence IMMEDIATE.
    //
    odb::sqlite::connection_ptr c (db ().connection ());
    sqlite3_busy_timeout (c->handle (), traits_type::busy_timeout);

    return c->begin_immediate ();
  }

  template <typename T>
  void basic_ledger_database<T>::
  upsert (ledger_entry&& e)
  {
    // Find then update/persist under the write lock makes the write atomic
    // for its key without relying on exceptions for the "already there"
    // case.
    //
    odb::transaction t (begin_write ());

    e.recorded_at (stamp ());

    if (db ().template find<ledger_entry> (e.asset_id ()))
      db ().update (e);
    else
      db ().persist (e);

    t.commit ();
  }

  template <typename T>
  void basic_ledger_database<T>::
  record_downloaded (const string_type& a,
                     const string_type& al,
                     const string_type& cs,
                     const string_type& d)
  {
    try
    {
      upsert (ledger_entry (a, al, ledger_status::downloaded, cs, d, 0));
    }
    catch (const odb::exception& e)
    {
      throw ledger_error (std::string ("unable to record download: ") +
                          e.what (),
                          "record_downloaded");
    }
  }

  template <typename T>
  void basic_ledger_database<T>::
  record_failed (const string_type& a,
                 const string_type& al,
                 const string_type& err)
  {
    try
    {
      upsert (ledger_entry (a,
                            al,
                            ledger_status::failed,
                            "",
                            "",
                            0,
                            sanitize_error_text (err, traits_type::max_error)));
    }
    catch (const odb::exception& e)
    {
      throw ledger_error (std::string ("unable to record failure: ") +
                          e.what (),
                          "record_failed");
    }
  }

  template <typename T>
  std::size_t basic_ledger_database<T>::
  purge (unsigned int days,
         bool only_failed,
         const std::optional<string_type>& al)
  {
    using query = odb::query<ledger_entry>;

    std::int64_t cutoff (stamp () -
                         static_cast<std::int64_t> (days) * 24 * 3600 * 1000);

    query q (query::recorded_at < cutoff);

    if (only_failed)
      q = q && query::status == ledger_status::failed;

    if (al)
      q = q && query::album_id == *al;

    try
    {
      // A single statement in a single transaction: either every matching
      // row goes or, on failure, none does.
      //
      odb::transaction t (begin_write ());
      std::size_t n (
        static_cast<std::size_t> (db ().template erase_query<ledger_entry> (q)));
      t.commit ();

      return n;
    }
    catch (const odb::exception& e)
    {
      throw ledger_error (std::string ("cleanup failed: ") + e.what (),
                          "purge");
    }
  }

  template <typename T>
  fs::path basic_ledger_database<T>::
  backup (const fs::path& dest)
  {
    std::string n (std::string (traits_type::backup_prefix) +
                   backup_timestamp () +
                   traits_type::backup_ext);

    fs::path d (dest);

    if (d.empty ())
      d = backup_directory () / n;
    else if (!d.has_filename ())
      d /= n;

    if (d.has_parent_path ())
    {
      std::error_code ec;
      fs::create_directories (d.parent_path (), ec);

      if (ec)
        throw ledger_error ("unable to create backup directory " +
                            d.parent_path ().string () + ": " + ec.message (),
                            "backup");
    }

    odb::connection_ptr c (db ().connection ());
    sqlite3* src (static_cast<odb::sqlite::connection&> (*c).handle ());
    sqlite3* dst (nullptr);

    if (sqlite3_open_v2 (d.string ().c_str (),
                         &dst,
                         SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                         nullptr) != SQLITE_OK)
    {
      std::string m (dst != nullptr ? sqlite3_errmsg (dst) : "out of memory");
      sqlite3_close (dst);
      throw ledger_error ("unable to create backup " + d.string () + ": " + m,
                          "backup");
    }

    // Copy everything in one step: the ledger is small and we would rather
    // not see it change halfway through.
    //
    int rc (SQLITE_ERROR);

    if (sqlite3_backup* b = sqlite3_backup_init (dst, "main", src, "main"))
    {
      rc = sqlite3_backup_step (b, -1);
      sqlite3_backup_finish (b);
    }

    std::string m (sqlite3_errmsg (dst));
    sqlite3_close (dst);

    if (rc != SQLITE_DONE)
    {
      std::error_code ec;
      fs::remove (d, ec);
      throw ledger_error ("unable to write backup " + d.string () + ": " + m,
                          "backup");
    }

    return d;
  }

  template <typename T>
  std::vector<ledger_backup> basic_ledger_database<T>::
  backups (const fs::path& d) const
  {
    fs::path dir (d.empty () ? backup_directory () : d);
    std::vector<ledger_backup> r;

    std::error_code ec;
    if (!fs::is_directory (dir, ec))
      return r;

    for (const fs::directory_entry& e: fs::directory_iterator (dir, ec))
    {
      if (!e.is_regular_file (ec) ||
          e.path ().extension () != traits_type::backup_ext)
        continue;

      ledger_backup b;
      b.path = e.path ();
      b.size = e.file_size (ec);
      b.modified = e.last_write_time (ec);
      r.push_back (std::move (b));
    }

    if (ec)
      throw ledger_error ("unable to list backups in " + dir.string () + ": " +
                          ec.message (),
                          "backups");

    // Newest first. Names carry a sortable timestamp but user-named backups
    // don't, so go by modification time and fall back to the name.
    //
    std::sort (r.begin (), r.end (),
               [] (const ledger_backup& x, const ledger_backup& y)
               {
                 if (x.modified != y.modified)
                   return x.modified > y.modified;
                 return x.path.filename () > y.path.filename ();
               });

    return r;
  }

  template <typename T>
  fs::path basic_ledger_database<T>::
  restore (const fs::path& src)
  {
    std::error_code ec;

    if (!fs::is_regular_file (src, ec))
      throw ledger_error ("backup not found: " + src.string (), "restore");

    if (fs::equivalent (src, path_, ec))
      throw ledger_error ("cannot restore the ledger onto itself", "restore");

    // Make sure it is a ledger before we touch anything.
    //
    {
      sqlite3* h (nullptr);
      bool ok (false);

      if (sqlite3_open_v2 (src.string ().c_str (),
                           &h,
                           SQLITE_OPEN_READONLY,
                           nullptr) == SQLITE_OK)
      {
        sqlite3_stmt* s (nullptr);
        const char* q (
          "SELECT name FROM sqlite_master WHERE type='table' AND name='downloads'");

        if (sqlite3_prepare_v2 (h, q, -1, &s, nullptr) == SQLITE_OK)
        {
          ok = sqlite3_step (s) == SQLITE_ROW;
          sqlite3_finalize (s);
        }
      }

      sqlite3_close (h);

      if (!ok)
        throw ledger_error ("not a ledger backup: " + src.string (),
                            "restore");
    }

    fs::path snap (backup (backup_directory () /
                           (std::string (traits_type::restore_prefix) +
                            backup_timestamp () +
                            traits_type::backup_ext)));

    close ();

    try
    {
      // Stale WAL/SHM files would otherwise be replayed on top of the
      // restored content.
      //
      fs::remove (fs::path (path_.string () + "-wal"), ec);
      fs::remove (fs::path (path_.string () + "-shm"), ec);

      fs::copy_file (src, path_, fs::copy_options::overwrite_existing);
    }
    catch (const fs::filesystem_error& e)
    {
      open ();
      throw ledger_error (std::string ("unable to restore: ") + e.what (),
                          "restore");
    }

    open ();
    return snap;
  }

  template <typename T>
  void basic_ledger_database<T>::
  vacuum ()
  {
    // VACUUM can't run inside a transaction.
    //
    odb::connection_ptr c (db ().connection ());
    sqlite3* h (static_cast<odb::sqlite::connection&> (*c).handle ());

    char* m (nullptr);
    if (sqlite3_exec (h, "VACUUM", nullptr, nullptr, &m) != SQLITE_OK)
    {
      std::string s (m != nullptr ? m : "unknown error");
      sqlite3_free (m);
      throw ledger_error ("vacuum failed: " + s, "vacuum");
    }
  }

  template <typename T>
  bool basic_ledger_database<T>::
  check () const
  {
    odb::transaction t (db ().begin ());
    bool ok (true);

    odb::sqlite::connection& c (
      static_cast<odb::sqlite::connection&> (t.connection ()));

    sqlite3_stmt* s (nullptr);
    const char* q ("PRAGMA integrity_check");

    if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) == SQLITE_OK)
    {
      if (sqlite3_step (s) == SQLITE_ROW)
      {
        const char* r (
          reinterpret_cast<const char*> (sqlite3_column_text (s, 0)));

        if (r == nullptr || std::string (r) != "ok")
          ok = false;
      }
      sqlite3_finalize (s);
    }
    else
      ok = false;

    t.commit ();
    return ok;
  }

  template <typename T>
  void basic_ledger_database<T>::
  close ()
  {
    db_.reset ();
  }

  template <typename T>
  void basic_ledger_database<T>::
  open ()
  {
    if (db_ == nullptr)
      init ();
  }
}
