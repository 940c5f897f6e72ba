#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include <albumsync/download/download-types.hxx>

namespace albumsync
{
  namespace json = boost::json;

  // Normalization of Immich JSON documents into our types.
  //
  // The server has moved fields around between releases, so rather than
  // probing shapes all over the place we accept the known variants here and
  // hand out one canonical form. Unknown fields are ignored and missing
  // optional ones get their defaults.
  //
  struct immich_parser
  {
    // Album from an /albums entry or /albums/{id} document. The assets are
    // not parsed (see parse_album_assets()).
    //
    static album
    parse_album (const json::value&);

    // Parse the /albums array. Entries without an id are dropped.
    //
    static std::vector<album>
    parse_albums (const json::value&);

    // Asset from an album's asset list. Return nullopt if the entry has no
    // id (there is nothing we could download).
    //
    // The name falls back to unnamed-<id> and the size is the first positive
    // of exifInfo.fileSizeInByte, size, fileSize and originalSize (0 if
    // none).
    //
    static std::optional<asset>
    parse_asset (const json::value&, const std::string& album_id);

    // Find the asset list in an /albums/{id} document: the first array among
    // assets, assetList and items, or the document itself if it is an array.
    // Throw api_error if there is none.
    //
    static std::vector<asset>
    parse_album_assets (const json::value&,
                        const std::string& album_id,
                        const std::string& endpoint);

    // Server version from a /server/about document ("v1.2.3", with the
    // abbreviated build if present) or nullopt.
    //
    static std::optional<std::string>
    parse_server_version (const json::value&);

    // String or nullopt if absent, null or not a string.
    //
    static std::optional<std::string>
    string_field (const json::object&, const char* name);

    // Positive integral value or nullopt. Numeric strings are accepted.
    //
    static std::optional<std::uint64_t>
    size_field (const json::object&, const char* name);
  };
}
