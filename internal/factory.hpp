#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/config_manager.hpp"
#include "internal/embedding/dimension_tracker.hpp"
#include "internal/store/store.hpp"

namespace engram::factory {

/*
  BuildStore

  Configures logging from config.logging, then constructs the backend
  selected by config.store (sqlite when unset).
  The store is returned uninitialized; callers Initialize it with the
  namespace from ConfigManager::Namespace().

  NOTE:
  This is the composition root of the library.
  It is the ONLY place allowed to know concrete backend types.
*/
std::unique_ptr<store::Store> BuildStore(const engram::runtime::config::RuntimeConfig& config);

/*
  Wraps a provider embedder so the first discovered dimension is saved
  through manager.UpdateDim. manager must outlive the tracker.
*/
std::shared_ptr<embedding::DimensionTracker> TrackDimension(std::shared_ptr<embedding::Embedder> embedder,
                                                            config::ConfigManager&               manager);

} // namespace engram::factory
