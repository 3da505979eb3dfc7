#include "internal/service/snapshot_service.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/persistence/file_io.hpp"
#include "internal/persistence/json_codec.hpp"

namespace gallery::service {

using observability::IntField;
using observability::StringField;

SnapshotService::SnapshotService(std::shared_ptr<store::RecordStore> store, gallery::runtime::config::PersistenceConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
  if (!store_) {
    throw std::invalid_argument("snapshot service requires a record store");
  }
}

// ------------------------------------------------------------
// Save
// ------------------------------------------------------------

bool SnapshotService::Save() const {
  bool ok = true;

  if (!config_.artworks_path().empty()) {
    const auto json = persistence::ExportArtworks(store_->GetAllArtworks());
    ok              = persistence::SaveToFile(json, config_.artworks_path()) && ok;
  }

  if (!config_.requests_path().empty()) {
    const auto json = persistence::ExportRequests(store_->GetAllRequests());
    ok              = persistence::SaveToFile(json, config_.requests_path()) && ok;
  }

  GALLERY_LOG_INFO("Snapshot saved", {IntField("artworks", static_cast<std::int64_t>(store_->ArtworkCount())),
                                      IntField("requests", static_cast<std::int64_t>(store_->RequestCount())),
                                      observability::BoolField("ok", ok)});
  return ok;
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

SnapshotService::LoadResult SnapshotService::Load() {
  LoadResult result;

  if (!config_.artworks_path().empty()) {
    if (auto json = persistence::LoadFromFile(config_.artworks_path())) {
      store_->SetAllArtworks(persistence::ImportArtworks(json));
      result.artworks_loaded = true;
    }
  }

  if (!config_.requests_path().empty()) {
    if (auto json = persistence::LoadFromFile(config_.requests_path())) {
      store_->SetAllRequests(persistence::ImportRequests(json));
      result.requests_loaded = true;
    }
  }

  GALLERY_LOG_INFO("Snapshot loaded", {StringField("artworks_path", config_.artworks_path()),
                                       StringField("requests_path", config_.requests_path()),
                                       IntField("artworks", static_cast<std::int64_t>(store_->ArtworkCount())),
                                       IntField("requests", static_cast<std::int64_t>(store_->RequestCount()))});
  return result;
}

} // namespace gallery::service
