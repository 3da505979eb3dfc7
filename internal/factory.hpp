#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/snapshot_service.hpp"
#include "internal/store/count_sink.hpp"
#include "internal/store/record_store.hpp"

namespace gallery::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects of one gallery session.
*/
struct RuntimeDependencies {
  std::shared_ptr<store::LatestCountSink>   counts;
  std::shared_ptr<store::RecordStore>       store;
  std::shared_ptr<service::SnapshotService> snapshots;
};

/*
  Build

  Composition root. Seeds the store with the predefined challenge
  requests when the config carries a challenge section, and loads
  the saved snapshot when persistence.load_on_start is set.
*/
RuntimeDependencies Build(const gallery::runtime::config::RuntimeConfig& config);

} // namespace gallery::factory
