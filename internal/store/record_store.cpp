#include "record_store.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "internal/model/records.hpp"
#include "internal/observability/logging.hpp"

namespace gallery::store {

using gallery::v1::ArtworkRecord;
using gallery::v1::RequestRecord;

RecordStore::RecordStore(std::shared_ptr<CountSink> counts, std::optional<Requests> predefined_requests)
    : counts_(std::move(counts)) {
  LoadPredefinedRequests(std::move(predefined_requests));
}

ChangeSignal::Subscription RecordStore::Subscribe(ChangeSignal::Handler handler) {
  return changed_.Subscribe(std::move(handler));
}

bool RecordStore::Unsubscribe(ChangeSignal::Subscription subscription) {
  return changed_.Unsubscribe(subscription);
}

// ------------------------------------------------------------
// Artworks
// ------------------------------------------------------------

void RecordStore::AddArtwork(ArtworkRecord artwork) {
  artworks_.push_back(std::move(artwork));
  OnDataChanged();
}

bool RecordStore::RemoveArtwork(const std::string& id) {
  auto it = FindArtwork(id);
  if (it == artworks_.end()) return false;

  artworks_.erase(it);
  OnDataChanged();
  return true;
}

std::optional<ArtworkRecord> RecordStore::GetArtwork(const std::string& id) const {
  auto it = FindArtwork(id);
  if (it == artworks_.end()) return std::nullopt;
  return *it;
}

const RecordStore::Artworks& RecordStore::GetAllArtworks() const {
  return artworks_;
}

std::size_t RecordStore::ArtworkCount() const {
  return artworks_.size();
}

void RecordStore::ToggleLike(const std::string& artwork_id) {
  auto it = FindArtwork(artwork_id);
  if (it == artworks_.end()) {
    GALLERY_LOG_WARN("ToggleLike: artwork not found", {observability::StringField("artwork_id", artwork_id)});
    return;
  }

  *it = model::WithLikeToggled(*it);
  OnDataChanged();
}

bool RecordStore::HasLiked(const std::string& artwork_id) const {
  auto it = FindArtwork(artwork_id);
  return it != artworks_.end() && it->is_liked();
}

// ------------------------------------------------------------
// Requests
// ------------------------------------------------------------

const RecordStore::Requests& RecordStore::GetAllRequests() const {
  return requests_;
}

const RecordStore::Requests& RecordStore::GetActiveRequests() const {
  if (active_requests_dirty_) {
    RebuildActiveRequestsCache();
  }
  return active_requests_;
}

bool RecordStore::CompleteRequest(const std::string& id) {
  auto it = std::find_if(requests_.begin(), requests_.end(), [&id](const RequestRecord& request) { return request.id() == id; });
  if (it == requests_.end()) return false;

  *it = model::WithCompleted(*it);
  OnDataChanged();
  return true;
}

std::size_t RecordStore::RequestCount() const {
  return requests_.size();
}

// ------------------------------------------------------------
// Bulk replace
// ------------------------------------------------------------

void RecordStore::SetAllArtworks(std::optional<Artworks> artworks) {
  // The replacement is fully built by the caller; the swap itself cannot fail.
  artworks_ = artworks ? std::move(*artworks) : Artworks{};
  OnDataChanged();
}

void RecordStore::SetAllRequests(std::optional<Requests> requests) {
  requests_ = requests ? std::move(*requests) : Requests{};
  OnDataChanged();
}

// ------------------------------------------------------------
// Internals
// ------------------------------------------------------------

void RecordStore::LoadPredefinedRequests(std::optional<Requests> predefined_requests) {
  if (!predefined_requests) return;

  requests_.insert(requests_.end(), std::make_move_iterator(predefined_requests->begin()),
                   std::make_move_iterator(predefined_requests->end()));

  // Initialization, not a runtime mutation: no change signal.
  active_requests_dirty_ = true;
  PushCounts();
}

void RecordStore::OnDataChanged() {
  active_requests_dirty_ = true;
  PushCounts();
  changed_.Fire();
}

void RecordStore::PushCounts() const {
  if (!counts_) return;

  counts_->SetArtworkCount(static_cast<std::int64_t>(artworks_.size()));
  counts_->SetActiveRequestCount(CountActiveRequests());
}

std::int64_t RecordStore::CountActiveRequests() const {
  return static_cast<std::int64_t>(std::count_if(requests_.begin(), requests_.end(), model::IsActive));
}

void RecordStore::RebuildActiveRequestsCache() const {
  active_requests_.clear();
  std::copy_if(requests_.begin(), requests_.end(), std::back_inserter(active_requests_), model::IsActive);
  active_requests_dirty_ = false;
}

RecordStore::Artworks::iterator RecordStore::FindArtwork(const std::string& id) {
  return std::find_if(artworks_.begin(), artworks_.end(), [&id](const ArtworkRecord& artwork) { return artwork.id() == id; });
}

RecordStore::Artworks::const_iterator RecordStore::FindArtwork(const std::string& id) const {
  return std::find_if(artworks_.begin(), artworks_.end(), [&id](const ArtworkRecord& artwork) { return artwork.id() == id; });
}

} // namespace gallery::store
