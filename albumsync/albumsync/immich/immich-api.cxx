#include <albumsync/immich/immich-api.hxx>

#include <optional>
#include <exception>
#include <system_error>

#include <boost/json.hpp>

#include <albumsync/albumsync-log.hxx>
#include <albumsync/albumsync-errors.hxx>
#include <albumsync/http/http-json.hxx>
#include <albumsync/immich/immich-parser.hxx>
#include <albumsync/throttle/rate-limiter.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

using namespace std;

namespace albumsync
{
  static http_client_traits<>
  client_traits (const immich_options& o)
  {
    http_client_traits<> r;
    r.verify_ssl = o.verify_ssl;
    r.user_agent = o.user_agent;
    return r;
  }

  immich_api::
  immich_api (asio::io_context& ioc,
              const immich_options& o,
              rate_limiter& l,
              cancellation_token& t)
    : http_ (ioc, client_traits (o)),
      endpoint_ (o.base_url),
      api_key_ (o.api_key),
      limiter_ (l),
      token_ (t)
  {
  }

  http_headers immich_api::
  headers (const string& accept) const
  {
    http_headers h;
    h.set ("x-api-key", api_key_);
    h.set ("Accept", accept);
    return h;
  }

  asio::awaitable<boost::json::value> immich_api::
  get_json (const string& url, const string& path)
  {
    co_await limiter_.wait_if_needed (&token_);

    http_response r (co_await http_.get (url,
                                         headers ("application/json"),
                                         &token_));

    if (!r.is_success ())
      throw api_error ("GET " + path + " failed with status " +
                         std::to_string (r.code ()) + ' ' +
                         to_string (r.status),
                       r.code (),
                       path);

    co_return parse_json (r, path);
  }

  asio::awaitable<vector<album>> immich_api::
  list_albums ()
  {
    const string p (immich_endpoint::path_albums ());
    co_return immich_parser::parse_albums (
      co_await get_json (endpoint_.albums (), p));
  }

  asio::awaitable<vector<asset>> immich_api::
  list_assets (const string& id)
  {
    const string p (immich_endpoint::path_album (id));
    co_return immich_parser::parse_album_assets (
      co_await get_json (endpoint_.album (id), p), id, p);
  }

  asio::awaitable<void> immich_api::
  fetch (const asset& a,
         const fs::path& dest,
         chrono::milliseconds timeout,
         cancellation_token& t)
  {
    fs::path part (dest);
    part += ".part";

    try
    {
      co_await http_.download (endpoint_.asset_original (a.id),
                               headers ("application/octet-stream"),
                               part,
                               timeout,
                               t);

      error_code ec;
      fs::rename (part, dest, ec);

      if (ec)
        throw filesystem_error ("unable to move " + part.string () +
                                " into place: " + ec.message (),
                                dest.string ());
    }
    catch (...)
    {
      // Never leave a partial file behind, whatever went wrong.
      //
      error_code ec;
      fs::remove (part, ec);
      throw;
    }
  }

  asio::awaitable<bool> immich_api::
  check_health ()
  {
    struct check
    {
      string url;
      string path;
    };

    const check ps[] = {
      {endpoint_.server_about (), immich_endpoint::path_server_about ()},
      {endpoint_.albums (), immich_endpoint::path_albums ()}};

    for (size_t i (0); i != 2; ++i)
    {
      const check& p (ps[i]);
      bool last (i + 1 == 2);

      log::trace ("checking " + p.url);

      http_response r;
      optional<string> failure;

      try
      {
        r = co_await http_.get (p.url, headers ("application/json"), &token_);
      }
      catch (const network_error& e)
      {
        failure = e.what ();
      }

      if (failure)
      {
        if (!last)
        {
          log::trace (p.path + ": " + *failure + ", trying next endpoint");
          continue;
        }

        log::error ("unable to connect to " + endpoint_.api () + ": " +
                    *failure);

        if (failure->find ("certificate") != string::npos)
          log::info ("  info: for a self-signed certificate set "
                     "IMMICH_SSL_VERIFY=false (insecure)");

        co_return false;
      }

      if (r.code () == 401 || r.code () == 403)
      {
        log::error ("authentication failed (status " +
                    std::to_string (r.code ()) +
                    "), check IMMICH_API_KEY");
        co_return false;
      }

      if (!r.is_success ())
      {
        if (!last)
        {
          log::trace (p.path + " returned status " +
                      std::to_string (r.code ()) + ", trying next endpoint");
          continue;
        }

        log::error ("server returned status " + std::to_string (r.code ()) +
                    ", check IMMICH_BASE_URL");
        co_return false;
      }

      // A reverse proxy or web UI answering in place of the API returns
      // HTML with a 200.
      //
      boost::system::error_code ec;
      boost::json::value v (boost::json::parse (r.body, ec));

      if (ec)
      {
        if (!last)
        {
          log::trace (p.path + " did not return JSON, trying next endpoint");
          continue;
        }

        log::error ("server did not return JSON, check IMMICH_BASE_URL");
        co_return false;
      }

      optional<string> ver (immich_parser::parse_server_version (v));

      if (i != 0)
        log::trace ("connected via " + p.path);

      log::info ("connected to Immich server" +
                 (ver ? " (" + *ver + ")" : string ()));
      co_return true;
    }

    co_return false;
  }
}
