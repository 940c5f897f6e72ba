#include <albumsync/albumsync-log.hxx>

#include <mutex>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace std;

namespace albumsync
{
  namespace log
  {
    namespace
    {
      mutex m;
      ofstream file;
      bool verb (false);

      string
      timestamp ()
      {
        using namespace chrono;

        auto now (system_clock::now ());
        time_t t (system_clock::to_time_t (now));
        auto ms (duration_cast<milliseconds> (now.time_since_epoch ()) % 1000);

        tm u;
        gmtime_r (&t, &u);

        ostringstream o;
        o << put_time (&u, "%Y-%m-%dT%H:%M:%S")
          << '.' << setfill ('0') << setw (3) << ms.count () << 'Z';
        return o.str ();
      }
    }

    ostream&
    operator<< (ostream& o, level l)
    {
      switch (l)
      {
      case level::trace:   return o << "TRACE";
      case level::info:    return o << "INFO";
      case level::warning: return o << "WARN";
      case level::error:   return o << "ERROR";
      }
      return o;
    }

    void
    open (const fs::path& p)
    {
      lock_guard<mutex> l (m);

      if (file.is_open ())
        file.close ();

      error_code ec;
      if (p.has_parent_path ())
        fs::create_directories (p.parent_path (), ec);

      file.open (p, ios::out | ios::app);

      if (!file.is_open ())
        cerr << "warning: unable to open log file " << p.string () << endl;
    }

    void
    close ()
    {
      lock_guard<mutex> l (m);

      if (file.is_open ())
        file.close ();
    }

    void
    verbose (bool v)
    {
      lock_guard<mutex> l (m);
      verb = v;
    }

    bool
    verbose ()
    {
      lock_guard<mutex> l (m);
      return verb;
    }

    string
    format_line (level lv, const string& s)
    {
      string f;
      f.reserve (s.size ());

      for (char c: s)
        f += (c == '\n' || c == '\r') ? ' ' : c;

      ostringstream o;
      o << '[' << timestamp () << "] [" << lv << "] " << f;
      return o.str ();
    }

    void
    write (level lv, const string& s)
    {
      lock_guard<mutex> l (m);

      switch (lv)
      {
      case level::trace:
        {
          if (verb)
            cout << s << endl;
          break;
        }
      case level::info:
        {
          cout << s << endl;
          break;
        }
      case level::warning:
        {
          cerr << "warning: " << s << endl;
          break;
        }
      case level::error:
        {
          cerr << "error: " << s << endl;
          break;
        }
      }

      // Trace lines are kept out of the file unless asked for; a large run
      // would otherwise produce one line per asset.
      //
      if (file.is_open () && (lv != level::trace || verb))
        file << format_line (lv, s) << '\n' << flush;
    }
  }
}
