#pragma once

#include "gallery/v1/records.pb.h"

namespace gallery::model {

/*
  Records are values: a change produces a new record and the
  caller replaces the stored one. Nothing edits a stored record
  field by field.
*/

inline gallery::v1::ArtworkRecord WithLikeToggled(const gallery::v1::ArtworkRecord& artwork) {
  gallery::v1::ArtworkRecord toggled = artwork;
  toggled.set_is_liked(!artwork.is_liked());
  return toggled;
}

inline gallery::v1::RequestRecord WithCompleted(const gallery::v1::RequestRecord& request) {
  gallery::v1::RequestRecord completed = request;
  completed.set_is_completed(true);
  return completed;
}

inline bool IsActive(const gallery::v1::RequestRecord& request) {
  return !request.is_completed();
}

} // namespace gallery::model
