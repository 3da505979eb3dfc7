#include "json_codec.hpp"

#include <google/protobuf/util/field_comparator.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <iterator>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"

namespace gallery::persistence {

using gallery::v1::ArtworkList;
using gallery::v1::ArtworkRecord;
using gallery::v1::RequestList;
using gallery::v1::RequestRecord;

namespace {

template <typename Wrapper>
std::string ToJson(const Wrapper& wrapper, std::string_view collection) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  // keep "isLiked": false and empty lists in the output
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(wrapper, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to export " + std::string(collection) + ": " + std::string(status.message()));
  }

  // the printer truncates strings holding invalid UTF-8 and still reports OK
  Wrapper reparsed;
  status = google::protobuf::util::JsonStringToMessage(json, &reparsed);
  if (!status.ok()) {
    throw std::runtime_error("Failed to export " + std::string(collection) + ": " + std::string(status.message()));
  }

  google::protobuf::util::DefaultFieldComparator comparator;
  comparator.set_treat_nan_as_equal(true);
  google::protobuf::util::MessageDifferencer differencer;
  differencer.set_field_comparator(&comparator);
  if (!differencer.Compare(wrapper, reparsed)) {
    throw std::runtime_error("Failed to export " + std::string(collection) + ": records do not survive JSON encoding");
  }
  return json;
}

template <typename Wrapper>
std::optional<Wrapper> FromJson(const std::optional<std::string>& json, std::string_view collection) {
  if (!json || json->empty()) {
    return std::nullopt;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Wrapper wrapper;
  auto    status = google::protobuf::util::JsonStringToMessage(*json, &wrapper, options);
  if (!status.ok()) {
    GALLERY_LOG_WARN("Failed to import records",
                     {observability::StringField("collection", collection),
                      observability::StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return wrapper;
}

template <typename Record>
std::vector<Record> Drain(google::protobuf::RepeatedPtrField<Record>* records) {
  return std::vector<Record>(std::make_move_iterator(records->begin()), std::make_move_iterator(records->end()));
}

} // namespace

// ------------------------------------------------------------
// Artworks
// ------------------------------------------------------------

std::string ExportArtworks(const std::vector<ArtworkRecord>& artworks) {
  ArtworkList wrapper;
  wrapper.mutable_artworks()->Reserve(static_cast<int>(artworks.size()));
  for (const auto& artwork : artworks) {
    *wrapper.add_artworks() = artwork;
  }
  return ToJson(wrapper, "artworks");
}

std::vector<ArtworkRecord> ImportArtworks(const std::optional<std::string>& json) {
  auto wrapper = FromJson<ArtworkList>(json, "artworks");
  if (!wrapper) return {};
  return Drain(wrapper->mutable_artworks());
}

// ------------------------------------------------------------
// Requests
// ------------------------------------------------------------

std::string ExportRequests(const std::vector<RequestRecord>& requests) {
  RequestList wrapper;
  wrapper.mutable_requests()->Reserve(static_cast<int>(requests.size()));
  for (const auto& request : requests) {
    *wrapper.add_requests() = request;
  }
  return ToJson(wrapper, "requests");
}

std::vector<RequestRecord> ImportRequests(const std::optional<std::string>& json) {
  auto wrapper = FromJson<RequestList>(json, "requests");
  if (!wrapper) return {};
  return Drain(wrapper->mutable_requests());
}

} // namespace gallery::persistence
