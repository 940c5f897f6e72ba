#include <albumsync/download/download-types.hxx>

#include <iomanip>

#include <albumsync/download/download-path.hxx>

using namespace std;

namespace albumsync
{
  // Failure text beyond this many characters is elided unless verbose.
  //
  static const size_t short_error (60);

  void
  print_summary (ostream& o, const download_summary& s, bool verbose)
  {
    auto field = [&o] (const char* n) -> ostream&
    {
      return o << "  " << left << setw (12) << n << right;
    };

    o << "Summary for \"" << s.album << "\":\n";

    field ("Downloaded:") << s.downloaded << '/' << s.total << '\n';
    field ("Skipped:") << s.skipped << '/' << s.total << '\n';
    field ("Failed:") << s.failed << '/' << s.total << '\n';

    // Skipped files are on disk too, so they count as done.
    //
    if (s.total_bytes != 0)
      field ("Size:") << format_size (s.transferred_bytes + s.skipped_bytes)
                      << " / " << format_size (s.total_bytes) << '\n';

    if (!s.directory.empty ())
      field ("Location:") << s.directory.string () << '\n';

    if (s.cancelled)
      field ("Cancelled:") << (s.cancel_reason.empty ()
                               ? string ("yes")
                               : s.cancel_reason)
                           << " (" << (s.total - s.attempted)
                           << " not attempted)\n";

    if (s.failures.empty ())
    {
      o << flush;
      return;
    }

    o << '\n' << "Failed items (" << s.failed << "):\n";

    size_t i (0);
    for (const failed_item& f: s.failures)
    {
      o << "  " << ++i << ". " << f.name << '\n';

      if (verbose)
      {
        o << "     asset: " << f.asset_id << '\n'
          << "     error: " << f.error << '\n';
      }
      else if (f.error.size () > short_error)
        o << "     error: " << f.error.substr (0, short_error) << "...\n";
      else
        o << "     error: " << f.error << '\n';
    }

    if (s.more_failures != 0)
      o << "  ... and " << s.more_failures << " more\n";

    o << '\n'
      << "Use --resume-failed to retry the failed items"
      << (verbose ? "" : ", --verbose for full error text") << ".\n"
      << flush;
  }
}
