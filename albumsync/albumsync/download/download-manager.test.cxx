#include <albumsync/download/download-manager.hxx>

#include <map>
#include <set>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <random>
#include <cassert>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <exception>
#include <functional>
#include <filesystem>

#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/throttle/rate-limiter.hxx>
#include <albumsync/download/download-path.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

using namespace std;
using namespace std::chrono;
using namespace albumsync;

namespace asio = boost::asio;
namespace fs = std::filesystem;

struct scratch
{
  fs::path path;

  scratch ()
  {
    random_device rd;
    path = fs::temp_directory_path () /
           ("albumsync-manager-" + to_string (rd ()));
    fs::create_directories (path);
  }

  ~scratch ()
  {
    error_code ec;
    fs::remove_all (path, ec);
  }
};

// Content and matching base64 SHA-1 checksums.
//
static const map<string, string> checksums {
  {"one",   "/gW83NxJKAEngaXxoqd8u1OY4QY="},
  {"two",   "rXguzax3D8brmmLkT5CHP7l/sms="},
  {"three", "uALzhDAssk+6sKRJl+ggvy6FB7s="}};

// In-memory ledger with the same interface as the real one. When broken,
// every call throws the way a closed or corrupt database would.
//
class memory_ledger
{
public:
  struct row
  {
    string album;
    ledger_status status;
    string checksum;
    string dir;
    string error;
    uint64_t seq;
  };

  bool
  is_downloaded (const string& asset,
                 const string& album,
                 const string& checksum,
                 const string& dir) const
  {
    check ();

    auto i (rows.find (asset));
    return i != rows.end () &&
           i->second.status == ledger_status::downloaded &&
           i->second.album == album &&
           i->second.checksum == checksum &&
           i->second.dir == dir;
  }

  vector<string>
  failed (const string& album) const
  {
    check ();

    vector<pair<uint64_t, string>> v;
    for (const auto& r: rows)
      if (r.second.album == album && r.second.status == ledger_status::failed)
        v.emplace_back (r.second.seq, r.first);

    sort (v.rbegin (), v.rend ());

    vector<string> ids;
    for (auto& p: v)
      ids.push_back (p.second);

    return ids;
  }

  void
  record_downloaded (const string& asset,
                     const string& album,
                     const string& checksum,
                     const string& dir)
  {
    check ();
    rows[asset] = row {album, ledger_status::downloaded, checksum, dir, "", ++seq};
  }

  void
  record_failed (const string& asset, const string& album, const string& error)
  {
    check ();
    rows[asset] = row {album, ledger_status::failed, "", "", error, ++seq};
  }

  size_t
  count (ledger_status s) const
  {
    return static_cast<size_t> (
      count_if (rows.begin (), rows.end (),
                [s] (const auto& r) {return r.second.status == s;}));
  }

  map<string, row> rows;
  uint64_t seq = 0;
  bool broken = false;

  // Threads the ledger was called from.
  //
  mutable mutex threads_mutex;
  mutable set<thread::id> threads;

private:
  void
  check () const
  {
    {
      lock_guard<mutex> l (threads_mutex);
      threads.insert (this_thread::get_id ());
    }

    if (broken)
      throw ledger_error ("database disk image is malformed", "query");
  }
};

// Asset source serving content from memory.
//
class memory_source: public asset_source
{
public:
  asio::awaitable<void>
  fetch (const asset& a,
         const fs::path& dest,
         milliseconds,
         cancellation_token& ct) override
  {
    ++calls;
    fetched.push_back (a.id);

    struct guard
    {
      size_t& n;
      ~guard () {--n;}
    } g {++in_flight};

    max_in_flight = max (max_in_flight, in_flight);

    if (on_call)
      on_call (calls);

    ct.throw_if_cancelled ();

    if (delay.count () != 0)
      co_await cancellable_sleep (delay, ct);

    if (broken.count (a.id) != 0)
      throw network_error ("connection reset by peer");

    if (auto i (flaky.find (a.id)); i != flaky.end () && i->second != 0)
    {
      --i->second;
      throw network_error ("timeout");
    }

    ofstream o (dest, ios::binary);
    o << content[a.id];
  }

  map<string, string> content;
  set<string> broken;
  map<string, size_t> flaky;
  milliseconds delay {0};
  function<void (size_t)> on_call;

  size_t calls = 0;
  size_t in_flight = 0;
  size_t max_in_flight = 0;
  vector<string> fetched;
};

static retry_options
quick ()
{
  retry_options o;
  o.base_delay = milliseconds (2);
  o.max_delay = milliseconds (5);
  o.max_jitter = milliseconds (1);
  return o;
}

struct fixture
{
  scratch out;
  memory_source source;
  memory_ledger ledger;
  rate_limiter limiter {1000};
  cancellation_token token;
  progress_tracker tracker;
  basic_download_manager<memory_ledger> manager {
    source, ledger, limiter, token, tracker, quick ()};

  album al;

  fixture ()
  {
    al.id = "al1";
    al.name = "Summer 2023";
  }

  // Add an asset whose content is one of the checksummed words (or
  // anything, without a valid checksum).
  //
  asset&
  add (const string& id,
       const string& body,
       uint64_t size = static_cast<uint64_t> (-1))
  {
    asset a;
    a.id = id;
    a.album_id = al.id;
    a.name = id + ".jpg";
    a.size = size == static_cast<uint64_t> (-1) ? body.size () : size;

    auto i (checksums.find (body));
    if (i != checksums.end ())
      a.checksum = i->second;

    source.content[id] = body;
    al.assets.push_back (a);
    return al.assets.back ();
  }

  fs::path
  dir () const
  {
    return out.path / sanitize_name (al.name);
  }

  download_summary
  run (download_options o = download_options ())
  {
    asio::io_context ioc;
    download_summary r;

    asio::co_spawn (
      ioc,
      manager.download_album (al, out.path, o),
      [&r] (exception_ptr e, download_summary s)
      {
        if (e)
          rethrow_exception (e);

        r = move (s);
      });

    ioc.run ();
    return r;
  }
};

static download_options
retries (uint32_t n)
{
  download_options o;
  o.max_retries = n;
  return o;
}

static void
test_basic ()
{
  fixture f;
  f.add ("a", "one");
  f.add ("b", "two");
  f.add ("c", "three");

  download_summary s (f.run ());

  assert (s.album == "Summer 2023");
  assert (s.directory == f.dir ());
  assert (s.total == 3 && s.attempted == 3);
  assert (s.downloaded == 3 && s.skipped == 0 && s.failed == 0);
  assert (s.transferred_bytes == 11);
  assert (s.total_bytes == 11);
  assert (!s.cancelled);

  assert (f.source.calls == 3);
  assert (fs::file_size (f.dir () / "a.jpg") == 3);
  assert (fs::file_size (f.dir () / "c.jpg") == 5);

  assert (f.ledger.count (ledger_status::downloaded) == 3);
  assert (f.ledger.is_downloaded ("b",
                                  "al1",
                                  checksums.at ("two"),
                                  f.dir ().string ()));

  // The final progress update went through and is complete.
  //
  optional<progress_snapshot> p (f.tracker.last ());
  assert (p && p->final);
  assert (p->current == 3 && p->total == 3);
  assert (p->stats.transferred_bytes == 11);
}

// A second run over unchanged content transfers nothing.
//
static void
test_idempotent ()
{
  fixture f;
  f.add ("a", "one");
  f.add ("b", "two");

  f.run ();
  assert (f.source.calls == 2);

  download_summary s (f.run ());

  assert (f.source.calls == 2);
  assert (s.skipped == 2 && s.downloaded == 0);
  assert (s.skipped_bytes == 6);

  // Unless forced.
  //
  download_options o;
  o.force = true;

  s = f.run (o);
  assert (f.source.calls == 4);
  assert (s.downloaded == 2 && s.skipped == 0);
}

// Two assets with the same original name (two cameras) each get their own
// file, and a second run still transfers nothing.
//
static void
test_same_names ()
{
  fixture f;
  f.add ("a", "one").name = "IMG_0001.JPG";
  f.add ("b", "two").name = "IMG_0001.JPG";

  download_summary s (f.run ());

  assert (s.downloaded == 2 && s.failed == 0);

  auto content = [&f] (const string& n)
  {
    ifstream is (f.dir () / n, ios::binary);
    return string ((istreambuf_iterator<char> (is)),
                   istreambuf_iterator<char> ());
  };

  assert (content ("IMG_0001.JPG") == "one");
  assert (content ("IMG_0001-b.JPG") == "two");
  assert (f.ledger.is_downloaded ("b",
                                  "al1",
                                  checksums.at ("two"),
                                  f.dir ().string ()));

  s = f.run ();

  assert (f.source.calls == 2);
  assert (s.skipped == 2 && s.downloaded == 0);

  // Resuming just the second one still targets its own file.
  //
  f.ledger.record_failed ("b", "al1", "timeout");
  fs::remove (f.dir () / "IMG_0001-b.JPG");

  download_options o;
  o.resume_failed_only = true;

  s = f.run (o);

  assert (s.total == 1 && s.downloaded == 1);
  assert (f.source.fetched.back () == "b");
  assert (content ("IMG_0001.JPG") == "one");
  assert (content ("IMG_0001-b.JPG") == "two");
}

// A file already on disk is adopted into the ledger; one with the wrong
// content is replaced.
//
static void
test_present ()
{
  fixture f;
  f.add ("a", "one");
  f.add ("b", "two");

  fs::create_directories (f.dir ());
  ofstream (f.dir () / "a.jpg", ios::binary) << "one";
  ofstream (f.dir () / "b.jpg", ios::binary) << "not two";

  download_summary s (f.run ());

  assert (s.skipped == 1 && s.downloaded == 1);
  assert (f.source.fetched == vector<string> {"b"});
  assert (f.ledger.is_downloaded ("a",
                                  "al1",
                                  checksums.at ("one"),
                                  f.dir ().string ()));

  ifstream is (f.dir () / "b.jpg");
  string c ((istreambuf_iterator<char> (is)), istreambuf_iterator<char> ());
  assert (c == "two");
}

// Existing files are hashed away from the io_context but the ledger is
// only ever called from the thread running it.
//
static void
test_present_hashing ()
{
  fixture f;

  fs::create_directories (f.dir ());

  for (size_t i (0); i != 16; ++i)
  {
    string id ("p" + to_string (i));
    f.add (id, "two");
    ofstream (f.dir () / (id + ".jpg"), ios::binary) << "two";
  }

  f.add ("n", "three");

  download_options o;
  o.concurrency = 4;

  download_summary s (f.run (o));

  assert (s.skipped == 16 && s.downloaded == 1 && s.failed == 0);
  assert (s.skipped_bytes == 48);
  assert (f.source.fetched == vector<string> {"n"});
  assert (f.ledger.count (ledger_status::downloaded) == 17);

  assert (f.ledger.threads.size () == 1);
  assert (*f.ledger.threads.begin () == this_thread::get_id ());
}

// Sizes 1MB, 2MB and 200MB with a 50MB limit: the last one is never
// requested.
//
static void
test_size_limit ()
{
  fixture f;
  f.add ("small", "one", 1024 * 1024);
  f.add ("medium", "two", 2 * 1024 * 1024);
  f.add ("huge", "three", 200 * 1024 * 1024);

  download_options o;
  o.size_limit = 50 * 1024 * 1024;

  download_summary s (f.run (o));

  assert (f.source.calls == 2);
  assert (find (f.source.fetched.begin (), f.source.fetched.end (), "huge") ==
          f.source.fetched.end ());

  assert (s.downloaded == 2 && s.skipped == 1 && s.failed == 0);
  assert (s.skipped_bytes == 200 * 1024 * 1024);
  assert (s.total_bytes == 203 * 1024 * 1024);

  // Skipping by size leaves no trace in the ledger.
  //
  assert (f.ledger.rows.count ("huge") == 0);
  assert (!fs::exists (f.dir () / "huge.jpg"));
}

static void
test_retry ()
{
  fixture f;
  f.add ("a", "one");
  f.source.flaky["a"] = 2;

  download_summary s (f.run (retries (3)));

  assert (s.downloaded == 1 && s.failed == 0);
  assert (f.source.calls == 3);
  assert (f.ledger.rows.at ("a").status == ledger_status::downloaded);
}

static void
test_failure ()
{
  fixture f;
  f.add ("a", "one");
  f.add ("b", "two");
  f.source.broken.insert ("b");

  download_summary s (f.run (retries (2)));

  assert (s.downloaded == 1 && s.failed == 1);
  assert (f.source.calls == 3);

  assert (s.failures.size () == 1);
  assert (s.failures[0].name == "b.jpg");
  assert (s.failures[0].asset_id == "b");
  assert (s.failures[0].error == "connection reset by peer");

  const memory_ledger::row& r (f.ledger.rows.at ("b"));
  assert (r.status == ledger_status::failed);
  assert (r.error == "connection reset by peer");

  assert (!fs::exists (f.dir () / "b.jpg"));

  // Resume only what failed, now that the server behaves.
  //
  f.source.broken.clear ();

  download_options o;
  o.resume_failed_only = true;

  s = f.run (o);

  assert (s.total == 1 && s.downloaded == 1);
  assert (f.source.fetched.back () == "b");
  assert (f.ledger.rows.at ("b").status == ledger_status::downloaded);

  // Nothing left to resume.
  //
  size_t calls (f.source.calls);
  s = f.run (o);

  assert (s.total == 0 && s.attempted == 0);
  assert (f.source.calls == calls);
}

static void
test_resume_nothing ()
{
  fixture f;
  f.add ("a", "one");

  download_options o;
  o.resume_failed_only = true;

  download_summary s (f.run (o));

  assert (s.empty ());
  assert (s.attempted == 0);
  assert (f.source.calls == 0);
}

// Only a bounded number of failures is kept for the report.
//
static void
test_many_failures ()
{
  fixture f;

  for (size_t i (0); i != 25; ++i)
  {
    string id ("x" + to_string (i));
    f.add (id, "one");
    f.source.broken.insert (id);
  }

  download_summary s (f.run (retries (1)));

  assert (s.failed == 25);
  assert (s.failures.size () == download_summary::max_failures);
  assert (s.more_failures == 5);
  assert (f.ledger.count (ledger_status::failed) == 25);
  assert (f.ledger.failed ("al1").size () == 25);
}

// A ledger that fails every call neither aborts the run nor hides files
// that were downloaded; without it, nothing is known to be present.
//
static void
test_broken_ledger ()
{
  fixture f;
  f.add ("a", "one");
  f.add ("b", "two");
  f.source.broken.insert ("b");
  f.ledger.broken = true;

  download_summary s (f.run (retries (1)));

  assert (s.downloaded == 1 && s.failed == 1);
  assert (fs::exists (f.dir () / "a.jpg"));

  s = f.run (retries (1));
  assert (s.downloaded == 1 && s.skipped == 0);
  assert (f.source.calls == 4);

  // Resume-only with an unreadable ledger has nothing to resume.
  //
  download_options o;
  o.resume_failed_only = true;

  s = f.run (o);
  assert (s.total == 0);
}

static void
test_dry_run ()
{
  fixture f;
  f.add ("a", "one");
  f.add ("b", "two", 1000);

  download_options o;
  o.dry_run = true;

  download_summary s (f.run (o));

  assert (s.downloaded == 2);
  assert (s.transferred_bytes == 1003);
  assert (f.source.calls == 0);
  assert (f.ledger.rows.empty ());
  assert (!fs::exists (f.dir ()));
}

static void
test_hostile_names ()
{
  fixture f;
  f.al.name = "../../etc";

  asset& a (f.add ("a", "one"));
  a.name = "../../passwd";

  download_summary s (f.run ());

  assert (s.downloaded == 1);
  assert (s.directory == f.out.path / "etc");
  assert (fs::exists (f.out.path / "etc" / "passwd"));
}

// Without declared sizes, the total is what was observed on disk.
//
static void
test_observed_total ()
{
  fixture f;
  f.add ("a", "one", 0);
  f.add ("b", "three", 0);

  download_summary s (f.run ());

  assert (s.total_bytes == 8);
  assert (f.tracker.last ()->stats.declared_bytes == 0);
  assert (f.tracker.last ()->stats.total_bytes () == 8);
}

// No more transfers than the concurrency bound at any time.
//
static void
test_concurrency ()
{
  fixture f;

  for (size_t i (0); i != 12; ++i)
    f.add ("x" + to_string (i), "one");

  f.source.delay = milliseconds (20);

  download_options o;
  o.concurrency = 3;

  download_summary s (f.run (o));

  assert (s.downloaded == 12);
  assert (f.source.max_in_flight == 3);

  f.source.max_in_flight = 0;
  o.force = true;
  o.concurrency = 1;

  f.run (o);
  assert (f.source.max_in_flight == 1);
}

// Once cancelled, nothing new starts, the interrupted transfer is not
// recorded as failed, and the summary says what happened.
//
static void
test_cancel ()
{
  fixture f;

  for (size_t i (0); i != 5; ++i)
    f.add ("x" + to_string (i), "one");

  f.source.on_call = [&f] (size_t n)
  {
    if (n == 2)
      f.token.cancel ("Interrupted by SIGINT");
  };

  download_options o;
  o.concurrency = 1;

  download_summary s (f.run (o));

  assert (s.cancelled);
  assert (s.cancel_reason == "Interrupted by SIGINT");
  assert (s.downloaded == 1);
  assert (s.failed == 0);
  assert (s.attempted == 1);
  assert (f.source.calls == 2);

  assert (f.ledger.count (ledger_status::failed) == 0);
  assert (f.ledger.count (ledger_status::downloaded) == 1);

  // Later runs with the same token do not start anything.
  //
  s = f.run (o);
  assert (s.cancelled && s.attempted == 0);
  assert (f.source.calls == 2);
}

// Cancellation during a slow in-flight transfer.
//
static void
test_cancel_in_flight ()
{
  fixture f;

  for (size_t i (0); i != 4; ++i)
    f.add ("x" + to_string (i), "one");

  f.source.delay = milliseconds (10000);

  asio::io_context ioc;
  download_summary s;
  download_options o;

  asio::co_spawn (
    ioc,
    f.manager.download_album (f.al, f.out.path, o),
    [&s] (exception_ptr e, download_summary r)
    {
      assert (!e);
      s = move (r);
    });

  asio::steady_timer t (ioc, milliseconds (50));
  t.async_wait ([&f] (const boost::system::error_code&)
                {
                  f.token.cancel ("Interrupted by SIGTERM");
                });

  auto start (steady_clock::now ());
  ioc.run ();

  assert (steady_clock::now () - start < milliseconds (5000));
  assert (s.cancelled);
  assert (s.cancel_reason == "Interrupted by SIGTERM");
  assert (s.downloaded == 0 && s.failed == 0);
  assert (f.ledger.rows.empty ());
  assert (f.source.in_flight == 0);
}

int
main ()
{
  test_basic ();
  test_idempotent ();
  test_same_names ();
  test_present ();
  test_present_hashing ();
  test_size_limit ();
  test_retry ();
  test_failure ();
  test_resume_nothing ();
  test_many_failures ();
  test_broken_ledger ();
  test_dry_run ();
  test_hostile_names ();
  test_observed_total ();
  test_concurrency ();
  test_cancel ();
  test_cancel_in_flight ();
}
