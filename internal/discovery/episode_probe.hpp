#pragma once

#include <filesystem>
#include <string>

#include "internal/discovery/episode_observation.hpp"
#include "internal/fingerprint/fingerprinter.hpp"
#include "internal/fingerprint/stability_checker.hpp"
#include "internal/fs/file_system.hpp"

namespace curator::discovery {

/*
  Per-episode unit of work run on the worker pool.

  Immutable after construction, so a single probe is shared by all tasks.
  Observe() never throws: failures end up in EpisodeObservation::error.
*/
class EpisodeProbe {
 public:
  EpisodeProbe(fs::FileSystemAdapterPtr fs, fingerprint::Fingerprinter fingerprinter, fingerprint::StabilityChecker stability,
               bool full_hash);

  EpisodeObservation Observe(const std::string& chunk, const std::filesystem::path& trajectory) const;

 private:
  void Fingerprint(EpisodeObservation& observation) const;

  fs::FileSystemAdapterPtr      fs_;
  fingerprint::Fingerprinter    fingerprinter_;
  fingerprint::StabilityChecker stability_;
  bool                          full_hash_ = false;
};

} // namespace curator::discovery
