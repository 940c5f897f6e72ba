#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json/value.hpp>

#include <albumsync/http/http-client.hxx>
#include <albumsync/immich/immich-endpoint.hxx>
#include <albumsync/download/download-types.hxx>
#include <albumsync/download/download-retry.hxx>

namespace albumsync
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  class rate_limiter;
  class cancellation_token;

  struct immich_options
  {
    std::string base_url;
    std::string api_key;
    bool verify_ssl = true;
    std::string user_agent = "albumsync";
  };

  // Immich server access.
  //
  // Listing calls go through the rate limiter. Asset transfers do not: the
  // retry policy admits each attempt through the limiter before calling
  // fetch().
  //
  // Non-success statuses become api_error (retryable for 408, 429 and 5xx),
  // transport failures become network_error.
  //
  class immich_api: public asset_source
  {
  public:
    immich_api (asio::io_context&,
                const immich_options&,
                rate_limiter&,
                cancellation_token&);

    immich_api (const immich_api&) = delete;
    immich_api& operator= (const immich_api&) = delete;

    asio::awaitable<std::vector<album>>
    list_albums ();

    asio::awaitable<std::vector<asset>>
    list_assets (const std::string& album_id);

    // Download the original into dest via a dest.part temporary that is
    // renamed into place once complete and removed on any failure.
    //
    asio::awaitable<void>
    fetch (const asset&,
           const fs::path& dest,
           std::chrono::milliseconds timeout,
           cancellation_token&) override;

    // Check that the server is reachable and accepts our key, reporting
    // the outcome as diagnostics. Try /server/about first and fall back to
    // /albums (older servers lack the former).
    //
    asio::awaitable<bool>
    check_health ();

    const immich_endpoint&
    endpoint () const noexcept
    {
      return endpoint_;
    }

  private:
    http_headers
    headers (const std::string& accept) const;

    asio::awaitable<boost::json::value>
    get_json (const std::string& url, const std::string& path);

  private:
    http_client http_;
    immich_endpoint endpoint_;
    std::string api_key_;
    rate_limiter& limiter_;
    cancellation_token& token_;
  };
}
