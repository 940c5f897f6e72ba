#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace albumsync
{
  // HTTP method. We only ever read from the server.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes we treat specially are named. Anything else the server
  // sends is still representable (the underlying type is the code itself).
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    request_timeout       = 408,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  // HTTP headers. Field names compare case-insensitively.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Replace any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value);

    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept {return fields.begin ();}
    const_iterator end ()   const noexcept {return fields.end ();}

  private:
    static bool
    same (const string_type&, const string_type&);
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
      : major (maj), minor (min) {}

    // Beast-style number (11 for HTTP/1.1).
    //
    unsigned
    number () const noexcept
    {
      return major * 10u + minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // URL split into what a connection needs.
  //
  struct url_parts
  {
    std::string scheme; // "http" or "https"
    std::string host;
    std::string port;
    std::string target; // Path, query and fragment ("/" if none).

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // scheme://host[:port], omitting the port if it is the default one.
    //
    std::string
    origin () const;
  };

  // Parse scheme://host[:port][/target]. Throw std::invalid_argument if
  // the scheme is neither http nor https or the host is missing. IPv6
  // literals and user info are not supported.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL it came from.
  //
  std::string
  resolve_location (const url_parts& base, const std::string& location);
}

#include <albumsync/http/http-types.ixx>
