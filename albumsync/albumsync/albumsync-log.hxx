#pragma once

#include <string>
#include <ostream>
#include <filesystem>

namespace albumsync
{
  namespace fs = std::filesystem;

  // Diagnostics.
  //
  // Console output follows the usual "error: ..." / "warning: ..." layout on
  // stderr, with plain informational lines on stdout. Every line is also
  // appended to the log file (if one was opened) prefixed with an ISO 8601
  // UTC timestamp and the level.
  //
  namespace log
  {
    enum class level
    {
      trace,   // Only shown with --verbose.
      info,
      warning,
      error
    };

    std::ostream&
    operator<< (std::ostream&, level);

    // Open (append) the log file, creating parent directories as needed.
    // Failing to open it is reported once and otherwise ignored: the console
    // still gets everything.
    //
    void
    open (const fs::path&);

    void
    close ();

    void
    verbose (bool);

    bool
    verbose ();

    void
    write (level, const std::string&);

    inline void
    trace (const std::string& m) {write (level::trace, m);}

    inline void
    info (const std::string& m) {write (level::info, m);}

    inline void
    warning (const std::string& m) {write (level::warning, m);}

    inline void
    error (const std::string& m) {write (level::error, m);}

    // Format the log file line (without the trailing newline). Newlines in
    // the message are folded so that one call is always one line.
    //
    std::string
    format_line (level, const std::string&);
  }
}
