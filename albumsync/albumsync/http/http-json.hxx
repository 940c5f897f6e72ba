#pragma once

#include <string>

#include <boost/json.hpp>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/http/http-response.hxx>

namespace albumsync
{
  // Parse the response body as JSON. Throw api_error (with the response
  // status and the endpoint) if the body is empty or not JSON.
  //
  template <typename S>
  boost::json::value
  parse_json (const basic_http_response<S>& r, const std::string& endpoint)
  {
    if (r.body.empty ())
      throw api_error ("empty response body from " + endpoint,
                       r.code (),
                       endpoint);

    // Use the error_code overload so that the failure is reported as ours.
    //
    boost::system::error_code ec;
    boost::json::value v (boost::json::parse (r.body, ec));

    if (ec)
      throw api_error ("invalid JSON from " + endpoint + ": " + ec.message (),
                       r.code (),
                       endpoint);

    return v;
  }
}
