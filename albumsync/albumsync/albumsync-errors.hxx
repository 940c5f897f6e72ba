#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>

namespace albumsync
{
  // Base of everything we throw on purpose.
  //
  // The code is a stable machine-readable tag (CONFIG_ERROR, API_ERROR, etc)
  // that ends up in the log file and in the failure list of a run summary.
  //
  class error: public std::runtime_error
  {
  public:
    error (std::string code, const std::string& what)
      : std::runtime_error (what), code_ (std::move (code)) {}

    const std::string&
    code () const noexcept
    {
      return code_;
    }

    // Whether another attempt at the same operation might succeed.
    //
    virtual bool
    retryable () const noexcept
    {
      return false;
    }

  private:
    std::string code_;
  };

  // Invalid or missing run parameters. Fatal before any transfer starts.
  //
  class configuration_error: public error
  {
  public:
    explicit
    configuration_error (const std::string& what)
      : error ("CONFIG_ERROR", what) {}
  };

  // Bad input shape or range (command line values, selections).
  //
  class validation_error: public error
  {
  public:
    explicit
    validation_error (const std::string& what, std::string field = "")
      : error ("VALIDATION_ERROR", what), field_ (std::move (field)) {}

    const std::string&
    field () const noexcept
    {
      return field_;
    }

  private:
    std::string field_;
  };

  // The server answered, but not with what we asked for.
  //
  // Client errors are final except for 408 (request timeout) and 429 (too
  // many requests), which are as transient as anything in the 5xx range.
  //
  class api_error: public error
  {
  public:
    api_error (const std::string& what,
               std::uint16_t status,
               std::string endpoint = "")
      : error ("API_ERROR", what),
        status_ (status),
        endpoint_ (std::move (endpoint)) {}

    std::uint16_t
    status () const noexcept
    {
      return status_;
    }

    const std::string&
    endpoint () const noexcept
    {
      return endpoint_;
    }

    bool
    retryable () const noexcept override
    {
      if (status_ == 408 || status_ == 429)
        return true;

      return status_ < 400 || status_ >= 500;
    }

  private:
    std::uint16_t status_;
    std::string endpoint_;
  };

  // Timeouts, refused connections, resets, TLS failures.
  //
  class network_error: public error
  {
  public:
    explicit
    network_error (const std::string& what)
      : error ("NETWORK_ERROR", what) {}

    bool
    retryable () const noexcept override
    {
      return true;
    }
  };

  class filesystem_error: public error
  {
  public:
    filesystem_error (const std::string& what, std::string path = "")
      : error ("FILE_SYSTEM_ERROR", what), path_ (std::move (path)) {}

    const std::string&
    path () const noexcept
    {
      return path_;
    }

  private:
    std::string path_;
  };

  // A destination resolved outside of the directory it must stay in.
  //
  class path_traversal_error: public error
  {
  public:
    explicit
    path_traversal_error (std::string path)
      : error ("PATH_TRAVERSAL_ERROR",
               "path escapes its base directory: " + path),
        path_ (std::move (path)) {}

    const std::string&
    path () const noexcept
    {
      return path_;
    }

  private:
    std::string path_;
  };

  // Resume ledger unavailable or inconsistent.
  //
  class ledger_error: public error
  {
  public:
    ledger_error (const std::string& what, std::string operation = "")
      : error ("DATABASE_ERROR", what), operation_ (std::move (operation)) {}

    const std::string&
    operation () const noexcept
    {
      return operation_;
    }

  private:
    std::string operation_;
  };

  // Cancellation is not a failure, so it does not derive from error and is
  // never caught by the per-item error handling.
  //
  class operation_cancelled: public std::runtime_error
  {
  public:
    explicit
    operation_cancelled (std::string reason)
      : std::runtime_error ("operation cancelled: " + reason),
        reason_ (std::move (reason)) {}

    const std::string&
    reason () const noexcept
    {
      return reason_;
    }

  private:
    std::string reason_;
  };

  // Collapse an error message into something safe to persist or print on a
  // single line: control characters become spaces and the result is cut to
  // at most n bytes.
  //
  std::string
  sanitize_error_text (const std::string&, std::size_t n = 500);
}
