#include <albumsync/http/http-types.hxx>

#include <sstream>
#include <stdexcept>

using namespace std;

namespace albumsync
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
    }
    return "GET";
  }

  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::partial_content:       return "Partial Content";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::unauthorized:          return "Unauthorized";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::request_timeout:       return "Request Timeout";
      case http_status::too_many_requests:     return "Too Many Requests";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "HTTP " + std::to_string (static_cast<uint16_t> (s));
  }

  string http_version::
  string () const
  {
    ostringstream os;
    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);
    return os.str ();
  }

  std::string url_parts::
  origin () const
  {
    std::string r (scheme + "://" + host);

    if (!(secure () && port == "443") && !(!secure () && port == "80"))
      r += ':' + port;

    return r;
  }

  url_parts
  parse_url (const std::string& url)
  {
    url_parts r;

    size_t p (url.find ("://"));
    if (p == std::string::npos)
      throw invalid_argument ("missing scheme in URL '" + url + "'");

    r.scheme = url.substr (0, p);

    for (char& c: r.scheme)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    if (r.scheme != "http" && r.scheme != "https")
      throw invalid_argument ("unsupported scheme in URL '" + url + "'");

    p += 3;

    // The authority ends at the start of the path, query or fragment.
    //
    size_t e (url.find_first_of ("/?#", p));
    if (e == std::string::npos)
      e = url.size ();

    std::string auth (url.substr (p, e - p));
    size_t c (auth.rfind (':'));

    if (c != std::string::npos)
    {
      r.host = auth.substr (0, c);
      r.port = auth.substr (c + 1);
    }
    else
      r.host = auth;

    if (r.host.empty ())
      throw invalid_argument ("missing host in URL '" + url + "'");

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    if (e == url.size ())
      r.target = "/";
    else if (url[e] != '/')
      r.target = '/' + url.substr (e);
    else
      r.target = url.substr (e);

    return r;
  }

  std::string
  resolve_location (const url_parts& b, const std::string& l)
  {
    if (l.find ("://") != std::string::npos)
      return l;

    if (l.size () > 1 && l[0] == '/' && l[1] == '/')
      return b.scheme + ':' + l;

    if (!l.empty () && l[0] == '/')
      return b.origin () + l;

    // Relative to the directory of the current target.
    //
    std::string t (b.target.substr (0, b.target.find_first_of ("?#")));
    return b.origin () + t.substr (0, t.rfind ('/') + 1) + l;
  }
}
