#include <limits>
#include <fstream>
#include <utility>
#include <type_traits>

#include <boost/beast/http.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <albumsync/albumsync-errors.hxx>
#include <albumsync/cancel/cancellation-token.hxx>

namespace albumsync
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return http::verb::get;
      case http_method::head: return http::verb::head;
    }
    return http::verb::get;
  }

  // Translate a transport failure into our error hierarchy. Cancellation
  // wins over whatever the aborted operation reported.
  //
  [[noreturn]] inline void
  throw_transport_error (const boost::system::system_error& e,
                         const url_parts& p,
                         cancellation_token* t)
  {
    if (t != nullptr && t->cancelled ())
      throw operation_cancelled (t->reason ().value_or ("cancelled"));

    if (e.code () == beast::error::timeout)
      throw network_error ("request to " + p.host + " timed out");

    throw network_error (p.host + ": " + e.code ().message ());
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<void> basic_http_client<T>::
  connect (Stream& s, const url_parts& p, clock::time_point deadline)
  {
    auto& layer (beast::get_lowest_layer (s));

    clock::time_point e (clock::now () +
                         std::chrono::milliseconds (traits_.connect_timeout));
    if (deadline < e)
      e = deadline;

    tcp::resolver r (ioc_);
    auto addrs (co_await r.async_resolve (p.host, p.port, asio::use_awaitable));

    if constexpr (std::is_same_v<Stream, ssl_stream_type>)
    {
      // Beast does not wrap SNI so we go to the OpenSSL handle directly.
      // Without it, virtual hosts hand out the wrong certificate.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), p.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      if (traits_.verify_ssl)
        s.set_verify_callback (ssl::host_name_verification (p.host));

      layer.expires_at (e);
      co_await layer.async_connect (addrs, asio::use_awaitable);

      layer.expires_at (e);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);
    }
    else
    {
      layer.expires_at (e);
      co_await layer.async_connect (addrs, asio::use_awaitable);
    }
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<void> basic_http_client<T>::
  shutdown (Stream& s)
  {
    // Plenty of servers just drop the connection after the response instead
    // of going through the TLS close_notify dance, so failures here mean
    // nothing.
    //
    beast::error_code ec;

    if constexpr (std::is_same_v<Stream, ssl_stream_type>)
    {
      beast::get_lowest_layer (s).expires_after (std::chrono::seconds (5));
      co_await s.async_shutdown (asio::redirect_error (asio::use_awaitable,
                                                       ec));
    }
    else
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);

    beast::get_lowest_layer (s).close ();
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s, const request_type& req, const url_parts& p)
  {
    auto& layer (beast::get_lowest_layer (s));

    co_await connect (s, p, clock::time_point::max ());

    http::request<http::empty_body> br;
    br.method (to_beast_verb (req.method));
    br.target (p.target);
    br.version (req.version.number ());

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    layer.expires_at (next_expiry (clock::time_point::max ()));
    co_await http::async_write (s, br, asio::use_awaitable);

    beast::flat_buffer b;
    http::response_parser<http::string_body> rp;
    rp.body_limit (traits_.body_limit);

    // A HEAD response announces a body that never comes.
    //
    if (req.method == http_method::head)
      rp.skip (true);

    layer.expires_at (next_expiry (clock::time_point::max ()));
    co_await http::async_read (s, b, rp, asio::use_awaitable);

    co_await shutdown (s);

    http::response<http::string_body> res (rp.release ());

    response_type r;
    r.status  = static_cast<http_status> (res.result_int ());
    r.version = http_version (static_cast<std::uint8_t> (res.version () / 10),
                              static_cast<std::uint8_t> (res.version () % 10));
    r.reason  = string_type (res.reason ());
    r.body    = std::move (res.body ());

    for (const auto& h: res)
      r.headers.add (string_type (h.name_string ()), string_type (h.value ()));

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req, cancellation_token* t)
  {
    for (std::uint8_t redirects (0);; ++redirects)
    {
      if (t != nullptr)
        t->throw_if_cancelled ();

      req.normalize (traits_.user_agent);
      url_parts p (parse_url (req.url));

      response_type r;

      try
      {
        if (p.secure ())
        {
          ssl_stream_type s (ioc_, ssl_ctx_);
          auto& l (beast::get_lowest_layer (s));
          cancel_guard g (t, [&l] (const std::string&) {l.close ();});

          r = co_await exchange (s, req, p);
        }
        else
        {
          beast::tcp_stream s (ioc_);
          cancel_guard g (t, [&s] (const std::string&) {s.close ();});

          r = co_await exchange (s, req, p);
        }
      }
      catch (const boost::system::system_error& e)
      {
        throw_transport_error (e, p, t);
      }

      std::optional<string_type> loc;
      if (traits_.follow_redirects && r.is_redirection ())
        loc = r.location ();

      if (!loc)
        co_return r;

      if (redirects >= traits_.max_redirects)
        throw network_error ("too many redirects from " + p.host);

      // Host belongs to the old URL.
      //
      req.url = resolve_location (p, *loc);
      req.headers.remove (string_type ("Host"));
    }
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<std::optional<typename basic_http_client<T>::string_type>>
  basic_http_client<T>::
  fetch (Stream& s,
         const request_type& req,
         const url_parts& p,
         const fs::path& file,
         clock::time_point deadline,
         std::uint64_t& bytes)
  {
    auto& layer (beast::get_lowest_layer (s));

    co_await connect (s, p, deadline);

    http::request<http::empty_body> br;
    br.method (http::verb::get);
    br.target (p.target);
    br.version (req.version.number ());

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    layer.expires_at (next_expiry (deadline));
    co_await http::async_write (s, br, asio::use_awaitable);

    // Read the header first so that we can bail out on a redirect or an
    // error status without touching the file. Then read the body in chunks
    // straight into the file.
    //
    beast::flat_buffer b;
    http::response_parser<http::buffer_body> rp;
    rp.body_limit (std::numeric_limits<std::uint64_t>::max ());

    layer.expires_at (next_expiry (deadline));
    co_await http::async_read_header (s, b, rp, asio::use_awaitable);

    unsigned status (rp.get ().result_int ());

    if (traits_.follow_redirects && status >= 300 && status < 400)
    {
      auto loc (rp.get ()[http::field::location]);

      if (!loc.empty ())
      {
        co_await shutdown (s);
        co_return resolve_location (p, string_type (loc));
      }
    }

    if (status < 200 || status >= 300)
    {
      co_await shutdown (s);

      throw api_error ("GET " + p.target + " failed with status " +
                         std::to_string (status) + ' ' +
                         to_string (static_cast<http_status> (status)),
                       static_cast<std::uint16_t> (status),
                       p.target);
    }

    std::ofstream ofs (file, std::ios::binary | std::ios::out | std::ios::trunc);

    if (!ofs)
      throw filesystem_error ("unable to open " + file.string () +
                              " for writing",
                              file.string ());

    char buf[16384];

    while (!rp.is_done ())
    {
      rp.get ().body ().data = buf;
      rp.get ().body ().size = sizeof (buf);

      layer.expires_at (next_expiry (deadline));

      // The buffer_body parser reports need_buffer whenever it filled our
      // buffer. That is not an error, just a request for another round.
      //
      beast::error_code ec;
      co_await http::async_read (s, b, rp,
                                 asio::redirect_error (asio::use_awaitable,
                                                       ec));

      if (ec && ec != http::error::need_buffer)
        throw beast::system_error (ec);

      std::size_t n (sizeof (buf) - rp.get ().body ().size);

      if (n != 0)
      {
        if (!ofs.write (buf, static_cast<std::streamsize> (n)))
          throw filesystem_error ("unable to write " + file.string (),
                                  file.string ());

        bytes += n;
      }
    }

    ofs.close ();

    if (!ofs)
      throw filesystem_error ("unable to write " + file.string (),
                              file.string ());

    co_await shutdown (s);
    co_return std::nullopt;
  }

  template <typename T>
  asio::awaitable<std::uint64_t> basic_http_client<T>::
  download (const string_type& url,
            const headers_type& headers,
            const fs::path& file,
            std::chrono::milliseconds timeout,
            cancellation_token& t)
  {
    clock::time_point deadline (clock::now () + timeout);

    request_type req (http_method::get, url, headers);

    for (std::uint8_t redirects (0);; ++redirects)
    {
      t.throw_if_cancelled ();

      req.normalize (traits_.user_agent);
      url_parts p (parse_url (req.url));

      std::uint64_t bytes (0);
      std::optional<string_type> loc;

      try
      {
        if (p.secure ())
        {
          ssl_stream_type s (ioc_, ssl_ctx_);
          auto& l (beast::get_lowest_layer (s));
          cancel_guard g (&t, [&l] (const std::string&) {l.close ();});

          loc = co_await fetch (s, req, p, file, deadline, bytes);
        }
        else
        {
          beast::tcp_stream s (ioc_);
          cancel_guard g (&t, [&s] (const std::string&) {s.close ();});

          loc = co_await fetch (s, req, p, file, deadline, bytes);
        }
      }
      catch (const boost::system::system_error& e)
      {
        throw_transport_error (e, p, &t);
      }

      // The body may have made it completely just as we were cancelled. We
      // don't care: a cancelled transfer never counts.
      //
      t.throw_if_cancelled ();

      if (!loc)
        co_return bytes;

      if (redirects >= traits_.max_redirects)
        throw network_error ("too many redirects from " + p.host);

      req.url = *loc;
      req.headers.remove (string_type ("Host"));
    }
  }
}
