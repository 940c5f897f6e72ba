#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <albumsync/http/http-types.hxx>

namespace albumsync
{
  // HTTP request. We never send a body, so there is no body member.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method = http_method::get;
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
      : method (m), url (std::move (u)) {}

    basic_http_request (http_method m, string_type u, headers_type h)
      : method (m), url (std::move (u)), headers (std::move (h)) {}

    // Path, query and fragment of the URL ("/" if there is none).
    //
    string_type
    target () const
    {
      return parse_url (url).target;
    }

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    // Fill in Host (from the URL) and User-Agent unless already set.
    //
    void
    normalize (const string_type& user_agent);
  };

  template <typename S>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_request<S>& r)
  {
    return o << r.method << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}

#include <albumsync/http/http-request.ixx>
