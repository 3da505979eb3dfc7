#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/store/record_store.hpp"

namespace gallery::service {

/*
  SnapshotService

  Moves the store's collections to and from the files named in
  PersistenceConfig. An empty path disables that collection.
*/
class SnapshotService {
 public:
  struct LoadResult {
    bool artworks_loaded = false;
    bool requests_loaded = false;
  };

  SnapshotService(std::shared_ptr<store::RecordStore> store, gallery::runtime::config::PersistenceConfig config);

  // Returns false if any configured file could not be written.
  bool Save() const;

  // A collection is replaced only when its file exists and was read.
  LoadResult Load();

 private:
  std::shared_ptr<store::RecordStore>         store_;
  gallery::runtime::config::PersistenceConfig config_;
};

} // namespace gallery::service
