#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <istream>
#include <ostream>
#include <optional>

#include <albumsync/download/download-types.hxx>

namespace albumsync
{
  // Order albums by name, case-insensitively (ties by exact name).
  //
  void
  sort_albums (std::vector<album>&);

  // Case-insensitive (ASCII) substring match. An empty needle matches.
  //
  bool
  contains_icase (const std::string& haystack, const std::string& needle);

  struct album_filter
  {
    bool all = false;
    std::optional<std::string> only;
    std::optional<std::string> exclude;

    // Whether the albums can be picked without asking.
    //
    bool
    unattended () const noexcept
    {
      return all || only || exclude;
    }
  };

  // Apply --all/--only first and --exclude to what that leaves. With just
  // --exclude, everything not excluded is selected.
  //
  std::vector<album>
  filter_albums (const std::vector<album>&, const album_filter&);

  // Parse an interactive selection against n listed albums: a comma
  // separated list of 1-based numbers and a-b ranges, or `all`. Return the
  // sorted, de-duplicated 0-based indices. Throw validation_error on
  // malformed or out of range input.
  //
  std::vector<std::size_t>
  parse_selection (const std::string&, std::size_t n);

  // List the albums on os and read the selection from is, asking again on
  // invalid input. Return nullopt on end of input.
  //
  std::optional<std::vector<album>>
  prompt_albums (const std::vector<album>&, std::istream&, std::ostream&);
}
