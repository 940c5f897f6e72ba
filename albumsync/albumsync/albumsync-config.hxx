#pragma once

#include <map>
#include <chrono>
#include <string>
#include <cstdint>
#include <cstddef>
#include <istream>
#include <optional>
#include <functional>
#include <filesystem>

namespace albumsync
{
  namespace fs = std::filesystem;

  // Run configuration assembled from the environment.
  //
  struct configuration
  {
    static constexpr std::size_t   default_concurrency = 5;
    static constexpr std::uint32_t default_max_retries = 3;
    static constexpr std::chrono::milliseconds default_timeout {30000};

    std::string api_key;
    std::string base_url; // Without trailing slashes.
    bool ssl_verify = true;

    std::size_t concurrency = default_concurrency;
    std::uint32_t max_retries = default_max_retries;
    std::chrono::milliseconds download_timeout = default_timeout;

    std::size_t rate_limit_requests = 10;
    std::chrono::milliseconds rate_limit_window {1000};

    fs::path default_output {"./media-downloads"};

    // Ledger, log file and backups.
    //
    fs::path cache_dir;

    bool production = false;
  };

  // Environment variable lookup. Tests substitute their own.
  //
  using environment =
    std::function<std::optional<std::string> (const std::string&)>;

  std::optional<std::string>
  process_environment (const std::string&);

  // Parse .env content: KEY=VALUE lines with optional `export ` prefix,
  // single or double quotes around the value, and # comments (full line, or
  // trailing after an unquoted value). Malformed lines are ignored.
  //
  std::map<std::string, std::string>
  parse_env_file (std::istream&);

  // Load the .env file into the process environment without overriding
  // variables that are already set. A missing file is not an error. Return
  // the number of variables set.
  //
  std::size_t
  load_env_file (const fs::path&);

  // Assemble and validate the configuration. Missing or invalid required
  // values throw configuration_error. Out of range optional values fall back
  // to their defaults with a warning.
  //
  configuration
  load_configuration (const environment& = process_environment);

  // $XDG_CACHE_HOME/albumsync, else ~/.cache/albumsync, else
  // ./.albumsync-cache.
  //
  fs::path
  default_cache_dir (const environment& = process_environment);

  // Expand a leading ~ to $HOME.
  //
  fs::path
  expand_path (const std::string&, const environment& = process_environment);

  // Command line values are validated strictly: out of range throws
  // validation_error naming the option.
  //
  std::size_t
  checked_concurrency (std::uint64_t);

  std::uint32_t
  checked_max_retries (std::uint64_t);
}
