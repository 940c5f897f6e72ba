#include <albumsync/immich/immich-parser.hxx>

#include <string>
#include <cassert>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/immich/immich-endpoint.hxx>

using namespace std;
using namespace albumsync;

static void
test_endpoint ()
{
  assert (immich_endpoint ("https://p.org").api () == "https://p.org/api");
  assert (immich_endpoint ("https://p.org/").api () == "https://p.org/api");
  assert (immich_endpoint ("https://p.org/api").api () == "https://p.org/api");
  assert (immich_endpoint ("https://p.org/api//").api () == "https://p.org/api");
  assert (immich_endpoint ("http://nas:2283/immich").api () ==
          "http://nas:2283/immich/api");

  immich_endpoint e ("https://p.org/api/");
  assert (e.albums () == "https://p.org/api/albums");
  assert (e.album ("a1") == "https://p.org/api/albums/a1");
  assert (e.asset_original ("x9") == "https://p.org/api/assets/x9/original");
  assert (e.server_about () == "https://p.org/api/server/about");
}

static void
test_albums ()
{
  json::value v (json::parse (R"([
    {"id": "a1", "albumName": "Summer 2023", "assetCount": 12, "shared": true},
    {"id": "a2", "albumName": "Winter"},
    {"albumName": "No id"},
    42
  ])"));

  vector<album> r (immich_parser::parse_albums (v));

  assert (r.size () == 2);
  assert (r[0].id == "a1");
  assert (r[0].name == "Summer 2023");
  assert (r[0].asset_count == 12);
  assert (r[0].assets.empty ());
  assert (r[1].name == "Winter");
  assert (r[1].asset_count == 0);

  try
  {
    immich_parser::parse_albums (json::parse (R"({"albums": []})"));
    assert (false);
  }
  catch (const api_error& e)
  {
    assert (e.endpoint () == "/albums");
  }
}

static void
test_asset ()
{
  // Size from EXIF first.
  //
  optional<asset> a (immich_parser::parse_asset (json::parse (R"({
    "id": "x1",
    "originalFileName": "IMG_0001.JPG",
    "checksum": "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=",
    "exifInfo": {"fileSizeInByte": 2048},
    "size": 1
  })"), "a1"));

  assert (a);
  assert (a->id == "x1");
  assert (a->album_id == "a1");
  assert (a->name == "IMG_0001.JPG");
  assert (a->checksum == "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
  assert (a->size == 2048);

  // Zero or missing sizes fall through to the next candidate.
  //
  a = immich_parser::parse_asset (json::parse (R"({
    "id": "x2",
    "exifInfo": {"fileSizeInByte": 0},
    "size": null,
    "fileSize": "4096"
  })"), "a1");

  assert (a);
  assert (a->name == "unnamed-x2");
  assert (a->checksum.empty ());
  assert (a->size == 4096);

  a = immich_parser::parse_asset (json::parse (R"({
    "id": "x3", "exifInfo": null, "originalSize": 7.0
  })"), "a1");

  assert (a && a->size == 7);

  a = immich_parser::parse_asset (json::parse (R"({"id": "x4", "size": -5})"),
                                  "a1");
  assert (a && a->size == 0);

  assert (!immich_parser::parse_asset (json::parse (R"({"name": "x"})"), "a1"));
  assert (!immich_parser::parse_asset (json::parse (R"({"id": 5})"), "a1"));
  assert (!immich_parser::parse_asset (json::parse (R"("x5")"), "a1"));
}

static void
test_album_assets ()
{
  const string ep ("/albums/a1");

  auto count ([&ep] (const char* doc)
  {
    return immich_parser::parse_album_assets (json::parse (doc), "a1", ep)
      .size ();
  });

  assert (count (R"({"assets": [{"id": "1"}, {"id": "2"}]})") == 2);
  assert (count (R"({"assetList": [{"id": "1"}]})") == 1);
  assert (count (R"({"items": [{"id": "1"}, {}, {"id": "3"}]})") == 2);
  assert (count (R"([{"id": "1"}])") == 1);
  assert (count (R"({"assets": []})") == 0);

  // A non-array under an earlier key does not shadow a later array.
  //
  assert (count (R"({"assets": null, "items": [{"id": "1"}]})") == 1);

  try
  {
    count (R"({"id": "a1", "albumName": "x"})");
    assert (false);
  }
  catch (const api_error& e)
  {
    assert (e.status () == 500);
    assert (e.endpoint () == ep);
    assert (e.retryable ());
  }
}

static void
test_version ()
{
  assert (immich_parser::parse_server_version (json::parse (
            R"({"version": "v1.106.4", "build": "1234567890abc"})")) ==
          "v1.106.4, build 1234567");

  assert (immich_parser::parse_server_version (json::parse (
            R"({"version": "v1.99.0"})")) == "v1.99.0");

  assert (immich_parser::parse_server_version (json::parse (
            R"({"serverVersion": "1.2.3"})")) == "1.2.3");

  assert (!immich_parser::parse_server_version (json::parse ("[]")));
}

int
main ()
{
  test_endpoint ();
  test_albums ();
  test_asset ();
  test_album_assets ();
  test_version ();
}
