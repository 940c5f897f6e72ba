#include <openssl/ssl.h>

namespace albumsync
{
  template <typename T>
  inline basic_http_client<T>::
  basic_http_client (asio::io_context& ioc, traits_type t)
    : ioc_ (ioc),
      traits_ (std::move (t)),
      ssl_ctx_ (ssl::context::tls_client)
  {
    configure_ssl ();
  }

  template <typename T>
  inline void basic_http_client<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    // Nothing older than TLS 1.2.
    //
    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::no_tlsv1 |
                          ssl::context::no_tlsv1_1);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url, headers_type h, cancellation_token* t)
  {
    co_return co_await request (request_type (http_method::get,
                                              url,
                                              std::move (h)),
                                t);
  }

  template <typename T>
  inline typename basic_http_client<T>::clock::time_point
  basic_http_client<T>::
  next_expiry (clock::time_point deadline) const
  {
    clock::time_point i (clock::now () +
                         std::chrono::milliseconds (traits_.request_timeout));
    return i < deadline ? i : deadline;
  }
}
