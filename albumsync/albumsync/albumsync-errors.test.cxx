#include <albumsync/albumsync-errors.hxx>

#include <cassert>
#include <string>

using namespace std;
using namespace albumsync;

// Retry decisions hinge on this classification, so pin down the edges of
// the 4xx range.
//
static void
test_retryable ()
{
  assert (!api_error ("bad request", 400).retryable ());
  assert (!api_error ("unauthorized", 401).retryable ());
  assert (!api_error ("not found", 404).retryable ());
  assert (!api_error ("gone", 410).retryable ());

  assert (api_error ("timeout", 408).retryable ());
  assert (api_error ("slow down", 429).retryable ());
  assert (api_error ("oops", 500).retryable ());
  assert (api_error ("bad gateway", 502).retryable ());
  assert (api_error ("unavailable", 503).retryable ());

  assert (network_error ("reset").retryable ());
  assert (!configuration_error ("missing key").retryable ());
  assert (!path_traversal_error ("../x").retryable ());
}

static void
test_codes ()
{
  assert (configuration_error ("x").code () == "CONFIG_ERROR");
  assert (validation_error ("x", "concurrency").code () == "VALIDATION_ERROR");
  assert (validation_error ("x", "concurrency").field () == "concurrency");
  assert (api_error ("x", 404, "/api/albums").endpoint () == "/api/albums");
  assert (network_error ("x").code () == "NETWORK_ERROR");
  assert (filesystem_error ("x", "/tmp").code () == "FILE_SYSTEM_ERROR");
  assert (path_traversal_error ("/etc").code () == "PATH_TRAVERSAL_ERROR");
  assert (ledger_error ("x", "purge").code () == "DATABASE_ERROR");
  assert (ledger_error ("x", "purge").operation () == "purge");

  // Cancellation must stay outside of the error hierarchy.
  //
  operation_cancelled c ("Interrupted by SIGINT");
  assert (c.reason () == "Interrupted by SIGINT");

  const std::runtime_error& r (c);
  assert (dynamic_cast<const error*> (&r) == nullptr);
}

static void
test_sanitize ()
{
  assert (sanitize_error_text ("plain") == "plain");
  assert (sanitize_error_text ("a\nb\tc\r") == "a b c ");
  assert (sanitize_error_text (string ("x\0y", 3)) == "x y");

  string l (600, 'e');
  assert (sanitize_error_text (l).size () == 500);
  assert (sanitize_error_text (l, 10) == string (10, 'e'));

  // A two-byte sequence split by the cut is dropped as a whole.
  //
  string u ("abc\xC3\xA9");
  assert (sanitize_error_text (u, 4) == "abc");
  assert (sanitize_error_text (u, 5) == u);
  assert (sanitize_error_text ("ab\xC3\xA9z", 4) == "ab\xC3\xA9");
}

int
main ()
{
  test_retryable ();
  test_codes ();
  test_sanitize ();
}
