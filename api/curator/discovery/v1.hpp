#pragma once

#include "internal/discovery/discovery_orchestrator.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/model/manifest.hpp"
#include "internal/model/manifest_row.hpp"
#include "internal/model/status.hpp"
#include "internal/util/errors.hpp"

namespace curator::discovery::v1 {
using namespace ::curator::discovery;
using namespace ::curator::model;
using ::curator::manifest::ManifestStore;
using ::curator::util::InvalidArgument;
using ::curator::util::IoError;
using ::curator::util::ManifestReadError;
using ::curator::util::ManifestWriteError;
}
