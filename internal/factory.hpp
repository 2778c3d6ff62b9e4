#pragma once

#include "config/config.pb.h"

#include "internal/discovery/discovery_orchestrator.hpp"

namespace curator::factory {

/*
  Composition root.

  Turns a RuntimeConfig into the pieces a discovery run is built from. Zero
  or empty config values fall back to the component defaults.
*/
discovery::DiscoverySettings BuildSettings(const curator::runtime::config::RuntimeConfig& config);

// Throws util::InvalidArgument when `since` does not parse.
discovery::DiscoveryOptions BuildOptions(const curator::runtime::config::RuntimeConfig& config);

} // namespace curator::factory
