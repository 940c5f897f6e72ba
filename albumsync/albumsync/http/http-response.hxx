#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <albumsync/http/http-types.hxx>

namespace albumsync
{
  // HTTP response with the body buffered in memory.
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_status  status = http_status::ok;
    http_version version;
    string_type  reason;
    headers_type headers;
    string_type  body;

    basic_http_response () = default;

    std::uint16_t
    code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return code () >= 200 && code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return code () >= 300 && code () < 400;
    }

    bool
    is_client_error () const noexcept
    {
      return code () >= 400 && code () < 500;
    }

    bool
    is_server_error () const noexcept
    {
      return code () >= 500 && code () < 600;
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    std::optional<std::uint64_t>
    content_length () const;
  };

  using http_response = basic_http_response<std::string>;
}

#include <albumsync/http/http-response.ixx>
