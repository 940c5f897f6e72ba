#include <albumsync/albumsync-config.hxx>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <charconv>
#include <stdexcept>

#include <albumsync/albumsync-log.hxx>
#include <albumsync/albumsync-errors.hxx>
#include <albumsync/http/http-types.hxx>

using namespace std;

namespace albumsync
{
  optional<string>
  process_environment (const string& n)
  {
    if (const char* v = getenv (n.c_str ()))
      return string (v);

    return nullopt;
  }

  static string
  trim (const string& s)
  {
    size_t b (s.find_first_not_of (" \t\r\n"));

    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (" \t\r\n"));
    return s.substr (b, e - b + 1);
  }

  map<string, string>
  parse_env_file (istream& is)
  {
    map<string, string> r;

    for (string l; getline (is, l); )
    {
      l = trim (l);

      if (l.empty () || l[0] == '#')
        continue;

      if (l.compare (0, 7, "export ") == 0)
        l = trim (l.substr (7));

      size_t p (l.find ('='));
      if (p == string::npos || p == 0)
        continue;

      string k (trim (l.substr (0, p)));
      string v (trim (l.substr (p + 1)));

      bool valid (!k.empty ());
      for (char c: k)
      {
        if (!isalnum (static_cast<unsigned char> (c)) && c != '_')
          valid = false;
      }

      if (!valid)
        continue;

      if (!v.empty () && (v[0] == '"' || v[0] == '\''))
      {
        // Quoted: everything up to the matching quote, the rest of the line
        // is ignored.
        //
        size_t q (v.find (v[0], 1));
        v = q != string::npos ? v.substr (1, q - 1) : v.substr (1);
      }
      else
      {
        // Unquoted: a # preceded by whitespace starts a comment.
        //
        for (size_t i (1); i < v.size (); ++i)
        {
          if (v[i] == '#' && (v[i - 1] == ' ' || v[i - 1] == '\t'))
          {
            v = trim (v.substr (0, i));
            break;
          }
        }
      }

      r[k] = v;
    }

    return r;
  }

  size_t
  load_env_file (const fs::path& f)
  {
    ifstream ifs (f);

    if (!ifs)
      return 0;

    size_t n (0);
    for (const auto& p: parse_env_file (ifs))
    {
      if (::setenv (p.first.c_str (), p.second.c_str (), 0 /* overwrite */) == 0 &&
          process_environment (p.first) == p.second)
        ++n;
    }

    log::trace ("loaded " + std::to_string (n) + " variable(s) from " + f.string ());
    return n;
  }

  // Parse a non-negative integer within [lo, hi], falling back to the
  // default with a warning if it is malformed or out of range.
  //
  template <typename T>
  static T
  ranged (const environment& env,
          const char* name,
          T def,
          uint64_t lo,
          uint64_t hi,
          const char* unit = "")
  {
    optional<string> v (env (name));

    if (!v || v->empty ())
      return def;

    string s (trim (*v));

    uint64_t n (0);
    auto r (from_chars (s.data (), s.data () + s.size (), n));

    if (r.ec == errc () && r.ptr == s.data () + s.size () &&
        n >= lo && n <= hi)
      return static_cast<T> (n);

    log::warning (string (name) + " must be between " + std::to_string (lo) +
                  " and " + std::to_string (hi) + unit + ", using default " +
                  std::to_string (static_cast<uint64_t> (def)));
    return def;
  }

  fs::path
  expand_path (const string& p, const environment& env)
  {
    if (p == "~" || p.compare (0, 2, "~/") == 0)
    {
      if (optional<string> h = env ("HOME"); h && !h->empty ())
        return fs::path (*h) / p.substr (p.size () > 1 ? 2 : 1);
    }

    return fs::path (p);
  }

  fs::path
  default_cache_dir (const environment& env)
  {
    if (optional<string> v = env ("XDG_CACHE_HOME"); v && !v->empty ())
      return fs::path (*v) / "albumsync";

    if (optional<string> h = env ("HOME"); h && !h->empty ())
      return fs::path (*h) / ".cache" / "albumsync";

    return fs::current_path () / ".albumsync-cache";
  }

  configuration
  load_configuration (const environment& env)
  {
    configuration c;

    optional<string> key (env ("IMMICH_API_KEY"));
    optional<string> url (env ("IMMICH_BASE_URL"));

    {
      string m;

      if (!key || key->empty ())
        m = "IMMICH_API_KEY";

      if (!url || url->empty ())
        m += (m.empty () ? "" : ", ") + string ("IMMICH_BASE_URL");

      if (!m.empty ())
        throw configuration_error (
          "missing required environment variable(s): " + m +
          " (set them in the .env file or the environment)");
    }

    if (key->size () < 10)
      throw configuration_error ("IMMICH_API_KEY appears to be invalid "
                                 "(too short)");

    c.api_key = *key;

    c.base_url = trim (*url);
    while (!c.base_url.empty () && c.base_url.back () == '/')
      c.base_url.pop_back ();

    url_parts p;
    try
    {
      p = parse_url (c.base_url);
    }
    catch (const invalid_argument&)
    {
      throw configuration_error ("IMMICH_BASE_URL must be a valid http or "
                                 "https URL, got '" + *url + "'");
    }

    c.production = env ("NODE_ENV") == "production";

    if (!p.secure ())
    {
      if (c.production)
        throw configuration_error ("IMMICH_BASE_URL must use https in "
                                   "production");

      log::warning ("using an unencrypted HTTP connection to " + p.host);
    }

    c.ssl_verify = env ("IMMICH_SSL_VERIFY") != "false";

    if (!c.ssl_verify)
      log::warning ("TLS certificate verification is disabled, this is "
                    "insecure");

    c.concurrency = ranged<size_t> (env, "IMMICH_CONCURRENCY",
                                    configuration::default_concurrency,
                                    1, 50);

    c.max_retries = ranged<uint32_t> (env, "IMMICH_MAX_RETRIES",
                                      configuration::default_max_retries,
                                      0, 10);

    c.download_timeout = chrono::milliseconds (
      ranged<uint64_t> (env, "IMMICH_DOWNLOAD_TIMEOUT",
                        configuration::default_timeout.count (),
                        5000, 600000, " ms"));

    c.rate_limit_requests = ranged<size_t> (env, "IMMICH_RATE_LIMIT_REQUESTS",
                                            10, 1, 1000);

    c.rate_limit_window = chrono::milliseconds (
      ranged<uint64_t> (env, "IMMICH_RATE_LIMIT_WINDOW_MS",
                        1000, 1, 3600000, " ms"));

    if (optional<string> o = env ("DEFAULT_OUTPUT"); o && !o->empty ())
      c.default_output = expand_path (*o, env);

    if (optional<string> d = env ("ALBUMSYNC_CACHE_DIR"); d && !d->empty ())
      c.cache_dir = expand_path (*d, env);
    else
      c.cache_dir = default_cache_dir (env);

    return c;
  }

  size_t
  checked_concurrency (uint64_t n)
  {
    if (n < 1 || n > 50)
      throw validation_error ("--concurrency must be between 1 and 50",
                              "concurrency");

    return static_cast<size_t> (n);
  }

  uint32_t
  checked_max_retries (uint64_t n)
  {
    if (n > 10)
      throw validation_error ("--max-retries must be between 0 and 10",
                              "max-retries");

    return static_cast<uint32_t> (n);
  }
}
