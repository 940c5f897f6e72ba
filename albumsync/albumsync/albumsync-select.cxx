#include <albumsync/albumsync-select.hxx>

#include <cctype>
#include <charconv>
#include <algorithm>

#include <albumsync/albumsync-errors.hxx>

using namespace std;

namespace albumsync
{
  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return s;
  }

  static string
  trim (const string& s)
  {
    size_t b (s.find_first_not_of (" \t\r\n"));

    if (b == string::npos)
      return string ();

    return s.substr (b, s.find_last_not_of (" \t\r\n") - b + 1);
  }

  void
  sort_albums (vector<album>& as)
  {
    stable_sort (as.begin (), as.end (),
                 [] (const album& x, const album& y)
                 {
                   string a (lower (x.name)), b (lower (y.name));
                   return a != b ? a < b : x.name < y.name;
                 });
  }

  bool
  contains_icase (const string& h, const string& n)
  {
    return lower (h).find (lower (n)) != string::npos;
  }

  vector<album>
  filter_albums (const vector<album>& as, const album_filter& f)
  {
    vector<album> r;

    for (const album& a: as)
    {
      if (!f.all && f.only && !contains_icase (a.name, *f.only))
        continue;

      if (f.exclude && contains_icase (a.name, *f.exclude))
        continue;

      r.push_back (a);
    }

    return r;
  }

  static size_t
  number (const string& s, const string& in)
  {
    string t (trim (s));

    size_t n (0);
    auto r (from_chars (t.data (), t.data () + t.size (), n));

    if (t.empty () || r.ec != errc () || r.ptr != t.data () + t.size ())
      throw validation_error ("invalid album number '" + t + "' in '" + in +
                                "'",
                              "selection");

    return n;
  }

  vector<size_t>
  parse_selection (const string& in, size_t n)
  {
    string s (trim (in));

    if (s.empty ())
      throw validation_error ("no albums selected", "selection");

    if (lower (s) == "all")
    {
      vector<size_t> r (n);
      for (size_t i (0); i != n; ++i)
        r[i] = i;

      return r;
    }

    vector<size_t> r;

    for (size_t b (0); b <= s.size (); )
    {
      size_t e (s.find (',', b));
      if (e == string::npos)
        e = s.size ();

      string item (trim (s.substr (b, e - b)));
      b = e + 1;

      if (item.empty ())
        continue;

      size_t lo, hi;
      size_t d (item.find ('-'));

      if (d != string::npos)
      {
        lo = number (item.substr (0, d), in);
        hi = number (item.substr (d + 1), in);
      }
      else
        lo = hi = number (item, in);

      if (lo == 0 || hi > n || lo > hi)
        throw validation_error ("album selection '" + item + "' is out of "
                                "range (1-" + std::to_string (n) + ")",
                                "selection");

      for (size_t i (lo); i <= hi; ++i)
        r.push_back (i - 1);
    }

    if (r.empty ())
      throw validation_error ("no albums selected", "selection");

    sort (r.begin (), r.end ());
    r.erase (unique (r.begin (), r.end ()), r.end ());
    return r;
  }

  optional<vector<album>>
  prompt_albums (const vector<album>& as, istream& is, ostream& os)
  {
    for (size_t i (0); i != as.size (); ++i)
      os << "  " << (i + 1) << ". " << as[i].name
         << " (" << as[i].asset_count << " items)" << '\n';

    for (;;)
    {
      os << "select album(s) to download (e.g. 1,3-5 or all): " << flush;

      string l;
      if (!getline (is, l))
      {
        os << endl;
        return nullopt;
      }

      try
      {
        vector<album> r;
        for (size_t i: parse_selection (l, as.size ()))
          r.push_back (as[i]);

        return r;
      }
      catch (const validation_error& e)
      {
        os << "error: " << e.what () << '\n';
      }
    }
  }
}
