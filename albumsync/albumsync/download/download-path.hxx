#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <albumsync/download/download-types.hxx>

namespace albumsync
{
  namespace fs = std::filesystem;

  // Turn an album or file name coming from the server into a single safe
  // path component: path separators and shell-hostile characters become
  // dashes, ".." sequences and leading dots are removed, dash runs are
  // collapsed and the result is limited to 255 bytes. Never empty (falls
  // back to "unnamed").
  //
  std::string
  sanitize_name (const std::string&);

  // Local file name of an asset (the original name if any, else one made up
  // from the id), sanitized.
  //
  std::string
  asset_file_name (const asset&);

  // Local file names of an album's assets, in order, distinct ignoring
  // case. The first asset keeps its name and a later one that clashes gets
  // its id appended to the stem (IMG_0001-<id>.JPG). Assigned over the whole
  // album so that the same asset ends up with the same name on every run.
  //
  std::vector<std::string>
  asset_file_names (const std::vector<asset>&);

  // Return the absolute, lexically normalized path if it is base itself or
  // somewhere below it. Throw path_traversal_error otherwise.
  //
  fs::path
  validate_within (const fs::path&, const fs::path& base);

  // Hex-encoded SHA-1 of the file contents. Throw filesystem_error if the
  // file cannot be read.
  //
  std::string
  compute_sha1 (const fs::path&);

  // Decode standard (padded) base64. Return nullopt if the input is not
  // valid base64.
  //
  std::optional<std::string>
  decode_base64 (const std::string&);

  std::string
  to_hex (const std::string& bytes);

  // True if the file exists and its SHA-1 equals the base64-encoded
  // checksum reported by the server. Any failure reads as a mismatch.
  //
  bool
  checksum_matches (const fs::path&, const std::string& base64);

  // Human-readable size (IEC units, one decimal).
  //
  std::string
  format_size (std::uint64_t bytes);

  std::string
  format_duration (double seconds);
}
