#include "factory.hpp"

#include <chrono>

#include "internal/util/time.hpp"

namespace curator::factory {

using curator::runtime::config::RuntimeConfig;

discovery::DiscoverySettings BuildSettings(const RuntimeConfig& config) {
  discovery::DiscoverySettings settings;

  const auto& layout = config.layout();
  if (!layout.trajectory_extension().empty()) settings.layout.trajectory_extension = layout.trajectory_extension();
  if (!layout.front_camera_dir().empty()) settings.layout.front_camera_dir = layout.front_camera_dir();
  if (!layout.wrist_camera_dir().empty()) settings.layout.wrist_camera_dir = layout.wrist_camera_dir();

  settings.fingerprinter = fingerprint::Fingerprinter(config.fingerprint().sample_bytes());

  const auto& stability = config.stability();
  settings.stability    = fingerprint::StabilityChecker(
      stability.min_bytes() != 0 ? stability.min_bytes() : fingerprint::StabilityChecker::kDefaultMinBytes,
      stability.pause_ms() != 0 ? std::chrono::milliseconds(stability.pause_ms()) : fingerprint::StabilityChecker::kDefaultPause);

  return settings;
}

discovery::DiscoveryOptions BuildOptions(const RuntimeConfig& config) {
  const auto& cfg = config.discovery();

  discovery::DiscoveryOptions options;
  options.data_root     = cfg.data_root();
  options.manifest_path = cfg.manifest_path();
  if (cfg.workers() != 0) options.workers = cfg.workers();
  if (!cfg.since().empty()) options.since = util::ParseTimestamp(cfg.since());
  options.full_hash = cfg.full_hash();
  options.only_chunks.assign(cfg.only_chunks().begin(), cfg.only_chunks().end());

  return options;
}

} // namespace curator::factory
