#include <albumsync/immich/immich-parser.hxx>

#include <charconv>

#include <albumsync/albumsync-errors.hxx>

using namespace std;

namespace albumsync
{
  optional<string> immich_parser::
  string_field (const json::object& o, const char* n)
  {
    const json::value* v (o.if_contains (n));

    if (v == nullptr || !v->is_string ())
      return nullopt;

    return json::value_to<string> (*v);
  }

  optional<uint64_t> immich_parser::
  size_field (const json::object& o, const char* n)
  {
    const json::value* v (o.if_contains (n));

    if (v == nullptr)
      return nullopt;

    if (v->is_uint64 ())
    {
      if (uint64_t r = v->as_uint64 ())
        return r;
    }
    else if (v->is_int64 ())
    {
      if (int64_t r = v->as_int64 (); r > 0)
        return static_cast<uint64_t> (r);
    }
    else if (v->is_double ())
    {
      if (double r = v->as_double (); r >= 1.0)
        return static_cast<uint64_t> (r);
    }
    else if (v->is_string ())
    {
      // Some versions serialize 64-bit sizes as strings.
      //
      const json::string& s (v->as_string ());

      uint64_t r (0);
      auto e (from_chars (s.data (), s.data () + s.size (), r));

      if (e.ec == errc () && e.ptr == s.data () + s.size () && r != 0)
        return r;
    }

    return nullopt;
  }

  album immich_parser::
  parse_album (const json::value& jv)
  {
    album a;

    if (const json::object* o = jv.if_object ())
    {
      if (auto s = string_field (*o, "id"))
        a.id = move (*s);

      if (auto s = string_field (*o, "albumName"))
        a.name = move (*s);

      if (auto n = size_field (*o, "assetCount"))
        a.asset_count = *n;
    }

    return a;
  }

  vector<album> immich_parser::
  parse_albums (const json::value& jv)
  {
    const json::array* a (jv.if_array ());

    if (a == nullptr)
      throw api_error ("album list is not an array", 500, "/albums");

    vector<album> r;
    r.reserve (a->size ());

    for (const json::value& v: *a)
    {
      album x (parse_album (v));

      if (!x.id.empty ())
        r.push_back (move (x));
    }

    return r;
  }

  optional<asset> immich_parser::
  parse_asset (const json::value& jv, const string& album_id)
  {
    const json::object* o (jv.if_object ());

    if (o == nullptr)
      return nullopt;

    asset a;

    if (auto s = string_field (*o, "id"); s && !s->empty ())
      a.id = move (*s);
    else
      return nullopt;

    a.album_id = album_id;

    if (auto s = string_field (*o, "originalFileName"); s && !s->empty ())
      a.name = move (*s);
    else
      a.name = "unnamed-" + a.id;

    if (auto s = string_field (*o, "checksum"))
      a.checksum = move (*s);

    optional<uint64_t> n;

    if (const json::value* e = o->if_contains ("exifInfo"))
    {
      if (const json::object* x = e->if_object ())
        n = size_field (*x, "fileSizeInByte");
    }

    for (const char* k: {"size", "fileSize", "originalSize"})
    {
      if (n)
        break;

      n = size_field (*o, k);
    }

    a.size = n ? *n : 0;
    return a;
  }

  vector<asset> immich_parser::
  parse_album_assets (const json::value& jv,
                      const string& album_id,
                      const string& endpoint)
  {
    const json::array* a (nullptr);

    if (const json::object* o = jv.if_object ())
    {
      for (const char* k: {"assets", "assetList", "items"})
      {
        if (const json::value* v = o->if_contains (k))
        {
          if ((a = v->if_array ()) != nullptr)
            break;
        }
      }
    }
    else
      a = jv.if_array ();

    if (a == nullptr)
      throw api_error ("assets not found in response for album " + album_id +
                       " (the response structure may have changed)",
                       500,
                       endpoint);

    vector<asset> r;
    r.reserve (a->size ());

    for (const json::value& v: *a)
    {
      if (optional<asset> x = parse_asset (v, album_id))
        r.push_back (move (*x));
    }

    return r;
  }

  optional<string> immich_parser::
  parse_server_version (const json::value& jv)
  {
    const json::object* o (jv.if_object ());

    if (o == nullptr)
      return nullopt;

    if (optional<string> v = string_field (*o, "version"))
    {
      if (optional<string> b = string_field (*o, "build"); b && !b->empty ())
        *v += ", build " + b->substr (0, 7);

      return v;
    }

    return string_field (*o, "serverVersion");
  }
}
