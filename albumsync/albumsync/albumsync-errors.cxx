#include <albumsync/albumsync-errors.hxx>

using namespace std;

namespace albumsync
{
  string
  sanitize_error_text (const string& s, size_t n)
  {
    string r;
    r.reserve (s.size () < n ? s.size () : n);

    for (char c: s)
    {
      if (r.size () == n)
        break;

      unsigned char u (static_cast<unsigned char> (c));

      // Keep UTF-8 continuation/lead bytes as is; only ASCII control
      // characters are a problem for a single-line record.
      //
      r += (u < 0x20 || u == 0x7f) ? ' ' : c;
    }

    // Don't leave a dangling partial UTF-8 sequence behind the cut.
    //
    if (r.size () == n && n < s.size ())
    {
      size_t i (r.size ());
      while (i > 0 && (static_cast<unsigned char> (r[i - 1]) & 0xC0) == 0x80)
        --i;

      if (i > 0)
      {
        unsigned char l (static_cast<unsigned char> (r[i - 1]));

        size_t w ((l & 0xE0) == 0xC0 ? 2 :
                  (l & 0xF0) == 0xE0 ? 3 :
                  (l & 0xF8) == 0xF0 ? 4 : 1);

        if (r.size () - (i - 1) < w)
          r.resize (i - 1);
      }
    }

    return r;
  }
}
