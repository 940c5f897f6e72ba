#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <albumsync/http/http-types.hxx>
#include <albumsync/http/http-request.hxx>
#include <albumsync/http/http-response.hxx>

namespace albumsync
{
  namespace fs    = std::filesystem;
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  class cancellation_token;

  // HTTP client configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using headers_type  = basic_http_headers<string_type>;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection establishment (resolve, connect, TLS handshake) timeout in
    // milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Idle timeout in milliseconds: the longest we wait for any single read
    // or write to make progress.
    //
    std::uint32_t request_timeout = 60000;

    std::uint8_t max_redirects = 5;
    bool follow_redirects = true;

    bool verify_ssl = true;

    // CA bundle (empty means the system default verify paths).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("albumsync");

    // Largest body request() is prepared to buffer in memory. Downloads go
    // to a file and are not limited.
    //
    std::uint64_t body_limit = 64 * 1024 * 1024;
  };

  // Coroutine HTTP/1.1 client over Boost.Beast.
  //
  // Every call opens its own connection (there is no keep-alive pool) which
  // keeps concurrent transfers independent of each other.
  //
  // Transport failures (resolution, connection, TLS, short reads) and
  // timeouts are reported as network_error. If a cancellation token is
  // passed, cancelling it closes the socket of any exchange in flight and
  // the call throws operation_cancelled instead.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using headers_type  = typename traits_type::headers_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;

    explicit
    basic_http_client (asio::io_context&, traits_type = traits_type ());

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform the request and buffer the response. A non-success status is
    // not an error at this level.
    //
    asio::awaitable<response_type>
    request (request_type, cancellation_token* = nullptr);

    asio::awaitable<response_type>
    get (const string_type& url,
         headers_type = headers_type (),
         cancellation_token* = nullptr);

    // Stream the response body of a GET into the file (created or
    // truncated), returning the number of bytes written. The file is only
    // opened once a 2xx status arrived; any other final status throws
    // api_error. The deadline bounds the whole exchange, redirects
    // included.
    //
    // A partially written file is left for the caller to remove.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const headers_type&,
              const fs::path& file,
              std::chrono::milliseconds deadline,
              cancellation_token&);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    using clock = std::chrono::steady_clock;
    using ssl_stream_type = beast::ssl_stream<beast::tcp_stream>;

    void
    configure_ssl ();

    // Resolve, connect and, for TLS, set SNI and handshake.
    //
    template <typename Stream>
    asio::awaitable<void>
    connect (Stream&, const url_parts&, clock::time_point deadline);

    template <typename Stream>
    asio::awaitable<void>
    shutdown (Stream&);

    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream&, const request_type&, const url_parts&);

    // Return the redirect target if the server sent one, otherwise stream
    // the body into the file and return nullopt.
    //
    template <typename Stream>
    asio::awaitable<std::optional<string_type>>
    fetch (Stream&,
           const request_type&,
           const url_parts&,
           const fs::path&,
           clock::time_point deadline,
           std::uint64_t& bytes);

    // Deadline for the next read or write: the idle timeout, capped by the
    // overall deadline.
    //
    clock::time_point
    next_expiry (clock::time_point deadline) const;

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  using http_client = basic_http_client<>;
}

#include <albumsync/http/http-client.ixx>
#include <albumsync/http/http-client.txx>
