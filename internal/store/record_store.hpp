#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gallery/v1/records.pb.h"
#include "internal/store/change_signal.hpp"
#include "internal/store/count_sink.hpp"

namespace gallery::store {

/*
  RecordStore

  Authoritative in-memory store for artworks and challenge requests.

  Every runtime mutation runs the same pipeline:
    1. mark the active-requests cache dirty
    2. push artwork / active request counts to the CountSink
    3. fire the change signal once

  Lookups are linear scans; with duplicate ids the first record in
  insertion order wins. Not thread-safe: all calls are expected
  from one thread.
*/
class RecordStore {
 public:
  using Artworks = std::vector<gallery::v1::ArtworkRecord>;
  using Requests = std::vector<gallery::v1::RequestRecord>;

  /*
    predefined_requests is the startup list from configuration.
    Loading it updates the counts but does not fire the change signal.
  */
  explicit RecordStore(std::shared_ptr<CountSink> counts = nullptr, std::optional<Requests> predefined_requests = std::nullopt);

  ChangeSignal::Subscription Subscribe(ChangeSignal::Handler handler);
  bool                       Unsubscribe(ChangeSignal::Subscription subscription);

  // Artworks
  void                                      AddArtwork(gallery::v1::ArtworkRecord artwork);
  bool                                      RemoveArtwork(const std::string& id);
  std::optional<gallery::v1::ArtworkRecord> GetArtwork(const std::string& id) const;
  const Artworks&                           GetAllArtworks() const;
  std::size_t                               ArtworkCount() const;

  // Logs a warning and changes nothing when the id is unknown.
  void ToggleLike(const std::string& artwork_id);
  // False both for "not liked" and for an unknown id.
  bool HasLiked(const std::string& artwork_id) const;

  // Requests
  const Requests& GetAllRequests() const;
  const Requests& GetActiveRequests() const;
  bool            CompleteRequest(const std::string& id);
  std::size_t     RequestCount() const;

  // Bulk replace, used by import. nullopt installs an empty collection.
  void SetAllArtworks(std::optional<Artworks> artworks);
  void SetAllRequests(std::optional<Requests> requests);

 private:
  void LoadPredefinedRequests(std::optional<Requests> predefined_requests);

  void         OnDataChanged();
  void         PushCounts() const;
  std::int64_t CountActiveRequests() const;
  void         RebuildActiveRequestsCache() const;

  Artworks::iterator       FindArtwork(const std::string& id);
  Artworks::const_iterator FindArtwork(const std::string& id) const;

  std::shared_ptr<CountSink> counts_;
  ChangeSignal               changed_;

  Artworks artworks_;
  Requests requests_;

  // Rebuilt at most once per mutation, on the first read after it.
  mutable Requests active_requests_;
  mutable bool     active_requests_dirty_ = true;
};

} // namespace gallery::store
