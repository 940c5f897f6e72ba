#include <albumsync/download/download-path.hxx>

#include <cctype>
#include <memory>
#include <fstream>
#include <algorithm>
#include <unordered_set>

#include <openssl/evp.h>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/progress/progress-tracker.hxx>

using namespace std;

namespace albumsync
{
  static const size_t max_name (255);

  // Drop a multi-byte UTF-8 sequence that was cut short at the end.
  //
  static void
  trim_utf8_tail (string& s)
  {
    size_t n (s.size ());
    size_t i (n);

    // Find the start of the last sequence (at most 3 continuation bytes
    // back).
    //
    while (i != 0 && n - i < 4 &&
           (static_cast<unsigned char> (s[i - 1]) & 0xC0) == 0x80)
      --i;

    if (i == 0)
      return;

    unsigned char c (static_cast<unsigned char> (s[i - 1]));
    size_t w (c < 0x80           ? 1 :
              (c & 0xE0) == 0xC0 ? 2 :
              (c & 0xF0) == 0xE0 ? 3 :
              (c & 0xF8) == 0xF0 ? 4 : 1);

    if (n - (i - 1) < w)
      s.resize (i - 1);
  }

  string
  sanitize_name (const string& name)
  {
    static const string bad ("/\\?%*:|\"<>");

    string r (name);

    for (char& c: r)
      if (bad.find (c) != string::npos)
        c = '-';

    // Remove ".." left to right, non-overlapping ("..." leaves one dot).
    //
    {
      string t;
      t.reserve (r.size ());

      for (size_t i (0); i < r.size (); ++i)
      {
        if (r[i] == '.' && i + 1 < r.size () && r[i + 1] == '.')
          ++i;
        else
          t += r[i];
      }

      r.swap (t);
    }

    r.erase (0, r.find_first_not_of ('.'));
    r.erase (0, r.find_first_not_of ('-'));

    if (size_t p = r.find_last_not_of ('-'); p != string::npos)
      r.resize (p + 1);
    else
      r.clear ();

    r.erase (unique (r.begin (), r.end (),
                     [] (char x, char y) {return x == '-' && y == '-';}),
             r.end ());

    // Trim whitespace.
    //
    static const char* ws (" \t\n\r\f\v");

    r.erase (0, r.find_first_not_of (ws));

    if (size_t p = r.find_last_not_of (ws); p != string::npos)
      r.resize (p + 1);
    else
      r.clear ();

    if (r.size () > max_name)
    {
      r.resize (max_name);
      trim_utf8_tail (r);
    }

    return r.empty () ? string ("unnamed") : r;
  }

  string
  asset_file_name (const asset& a)
  {
    return sanitize_name (a.name.empty () ? "unnamed-" + a.id : a.name);
  }

  static string
  fold (const string& s)
  {
    string r (s);
    for (char& c: r)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return r;
  }

  // Insert the suffix between the stem and the extension, shortening the
  // stem if the result would be too long.
  //
  static string
  suffixed (const string& n, const string& sfx)
  {
    size_t d (n.rfind ('.'));
    if (d == 0 || d == string::npos || n.size () - d > 16)
      d = n.size ();

    string stem (n, 0, d);
    string ext (n, d);

    if (stem.size () + sfx.size () + ext.size () > max_name)
    {
      stem.resize (max_name - min (max_name, sfx.size () + ext.size ()));
      trim_utf8_tail (stem);
    }

    return stem + sfx + ext;
  }

  vector<string>
  asset_file_names (const vector<asset>& as)
  {
    vector<string> r;
    r.reserve (as.size ());

    unordered_set<string> taken;

    for (const asset& a: as)
    {
      string n (asset_file_name (a));

      if (!taken.insert (fold (n)).second)
      {
        string id (sanitize_name (a.id));
        n = suffixed (n, '-' + id);

        for (size_t i (2); !taken.insert (fold (n)).second; ++i)
          n = suffixed (asset_file_name (a),
                        '-' + id + '-' + std::to_string (i));
      }

      r.push_back (move (n));
    }

    return r;
  }

  // Absolute, normalized, and without a trailing separator.
  //
  static fs::path
  normal (const fs::path& p)
  {
    fs::path r (fs::absolute (p).lexically_normal ());

    if (!r.has_filename () && r.has_relative_path ())
      r = r.parent_path ();

    return r;
  }

  fs::path
  validate_within (const fs::path& p, const fs::path& base)
  {
    fs::path r (normal (p));
    fs::path b (normal (base));

    auto m (mismatch (b.begin (), b.end (), r.begin (), r.end ()));

    if (m.first != b.end ())
      throw path_traversal_error (p.string ());

    return r;
  }

  string
  to_hex (const string& bytes)
  {
    static const char digits[] = "0123456789abcdef";

    string r;
    r.reserve (bytes.size () * 2);

    for (char c: bytes)
    {
      unsigned char b (static_cast<unsigned char> (c));
      r += digits[b >> 4];
      r += digits[b & 0x0F];
    }

    return r;
  }

  string
  compute_sha1 (const fs::path& f)
  {
    ifstream is (f, ios::binary);

    if (!is)
      throw filesystem_error ("unable to open " + f.string (), f.string ());

    unique_ptr<EVP_MD_CTX, decltype (&EVP_MD_CTX_free)> ctx (EVP_MD_CTX_new (),
                                                            &EVP_MD_CTX_free);

    if (!ctx || EVP_DigestInit_ex (ctx.get (), EVP_sha1 (), nullptr) != 1)
      throw runtime_error ("unable to initialize SHA-1 digest");

    char buf[65536];

    while (is)
    {
      is.read (buf, sizeof (buf));

      if (streamsize n = is.gcount (); n > 0)
        EVP_DigestUpdate (ctx.get (), buf, static_cast<size_t> (n));
    }

    if (is.bad ())
      throw filesystem_error ("unable to read " + f.string (), f.string ());

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx.get (), md, &n) != 1)
      throw runtime_error ("unable to finalize SHA-1 digest");

    return to_hex (string (reinterpret_cast<const char*> (md), n));
  }

  optional<string>
  decode_base64 (const string& s)
  {
    if (s.empty () || s.size () % 4 != 0)
      return nullopt;

    string r (s.size () / 4 * 3, '\0');

    int n (EVP_DecodeBlock (reinterpret_cast<unsigned char*> (r.data ()),
                            reinterpret_cast<const unsigned char*> (s.data ()),
                            static_cast<int> (s.size ())));
    if (n < 0)
      return nullopt;

    // EVP_DecodeBlock() decodes padding as zero bytes.
    //
    size_t pad (0);
    if (s[s.size () - 1] == '=') ++pad;
    if (s[s.size () - 2] == '=') ++pad;

    r.resize (static_cast<size_t> (n) - pad);
    return r;
  }

  bool
  checksum_matches (const fs::path& f, const string& base64)
  {
    optional<string> expected (decode_base64 (base64));

    if (!expected || expected->empty ())
      return false;

    error_code ec;
    if (!fs::is_regular_file (f, ec))
      return false;

    try
    {
      return compute_sha1 (f) == to_hex (*expected);
    }
    catch (const filesystem_error&)
    {
      return false;
    }
  }

  string
  format_size (uint64_t n)
  {
    return progress_tracker_traits<>::format_bytes (n);
  }

  string
  format_duration (double s)
  {
    return progress_tracker_traits<>::format_duration (s);
  }
}
