#pragma once

#include <string>
#include <utility>

namespace albumsync
{
  // Immich REST API endpoint builder.
  //
  // The configured base URL may or may not already end with the /api
  // prefix (both forms are common in the wild). We normalize it so that
  // exactly one is used:
  //
  //   https://photos.example.org      -> https://photos.example.org/api
  //   https://photos.example.org/api/ -> https://photos.example.org/api
  //
  class immich_endpoint
  {
  public:
    explicit
    immich_endpoint (const std::string& base)
      : api_ (normalize (base)) {}

    // Base URL including the /api prefix.
    //
    const std::string&
    api () const noexcept
    {
      return api_;
    }

    std::string
    albums () const
    {
      return api_ + path_albums ();
    }

    std::string
    album (const std::string& id) const
    {
      return api_ + path_album (id);
    }

    std::string
    asset_original (const std::string& id) const
    {
      return api_ + path_asset_original (id);
    }

    std::string
    server_about () const
    {
      return api_ + path_server_about ();
    }

    // Paths as reported in errors (relative to the server root).
    //
    static std::string
    path_albums ()
    {
      return "/albums";
    }

    static std::string
    path_album (const std::string& id)
    {
      return "/albums/" + id;
    }

    static std::string
    path_asset_original (const std::string& id)
    {
      return "/assets/" + id + "/original";
    }

    static std::string
    path_server_about ()
    {
      return "/server/about";
    }

    static std::string
    normalize (std::string base)
    {
      while (!base.empty () && base.back () == '/')
        base.pop_back ();

      const std::string p ("/api");

      if (base.size () < p.size () ||
          base.compare (base.size () - p.size (), p.size (), p) != 0)
        base += p;

      return base;
    }

  private:
    std::string api_;
  };
}
