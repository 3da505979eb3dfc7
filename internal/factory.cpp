#include "factory.hpp"

#include <cstdint>
#include <optional>
#include <utility>

#include "internal/observability/logging.hpp"

namespace gallery::factory {

namespace {

std::optional<store::RecordStore::Requests> PredefinedRequests(const gallery::runtime::config::RuntimeConfig& config) {
  if (!config.has_challenge()) {
    return std::nullopt;
  }

  const auto& predefined = config.challenge().predefined_requests();
  return store::RecordStore::Requests(predefined.begin(), predefined.end());
}

} // namespace

RuntimeDependencies Build(const gallery::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  deps.counts    = std::make_shared<store::LatestCountSink>();
  deps.store     = std::make_shared<store::RecordStore>(deps.counts, PredefinedRequests(config));
  deps.snapshots = std::make_shared<service::SnapshotService>(deps.store, config.persistence());

  if (config.persistence().load_on_start()) {
    deps.snapshots->Load();
  }

  GALLERY_LOG_INFO("Gallery store ready", {observability::IntField("artworks", static_cast<std::int64_t>(deps.store->ArtworkCount())),
                                           observability::IntField("requests", static_cast<std::int64_t>(deps.store->RequestCount()))});
  return deps;
}

} // namespace gallery::factory
