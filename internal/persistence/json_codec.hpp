#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gallery/v1/records.pb.h"

namespace gallery::persistence {

/*
  JSON export / import of record collections.

  Documents are single-field wrappers:
      { "artworks": [ ... ] }
      { "requests": [ ... ] }

  Export throws std::runtime_error when a record cannot be written
  faithfully, such as a string field holding invalid UTF-8.

  Import never throws. Absent, empty or malformed text, and a
  document without the wrapper field, all yield an empty collection;
  malformed text is logged as a warning.
*/

std::string ExportArtworks(const std::vector<gallery::v1::ArtworkRecord>& artworks);
std::string ExportRequests(const std::vector<gallery::v1::RequestRecord>& requests);

std::vector<gallery::v1::ArtworkRecord> ImportArtworks(const std::optional<std::string>& json);
std::vector<gallery::v1::RequestRecord> ImportRequests(const std::optional<std::string>& json);

} // namespace gallery::persistence
