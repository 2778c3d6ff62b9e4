#pragma once

#include <string>

#include "internal/discovery/episode_observation.hpp"
#include "internal/model/manifest_row.hpp"
#include "internal/model/status.hpp"

namespace curator::discovery {

/*
  Maps one episode observation to its lifecycle status.

  Policy, first match wins:
    1. no parseable index, or fingerprinting failed    → ERROR
    2. an existing file is still being written         → PENDING
    3. a camera video is absent                        → MISSING_SIDE
    4. no settled previous fingerprint                 → NEW
       (absent, or the previous row was PENDING/ERROR)
       previous fingerprint from another algorithm     → CHANGED
       previous fingerprint equal / different          → UNCHANGED / CHANGED

  Runs single-threaded after fan-in because step 4 needs the previous
  manifest.
*/
class StatusResolver {
 public:
  explicit StatusResolver(std::string fingerprint_algo);

  model::Status Resolve(const EpisodeObservation& observation, const model::ManifestRow* previous) const;

  model::ManifestRow BuildRow(const EpisodeObservation& observation, const model::ManifestRow* previous,
                              const std::string& discovered_at) const;

  const std::string& fingerprint_algo() const {
    return fingerprint_algo_;
  }

 private:
  std::string fingerprint_algo_;
};

} // namespace curator::discovery
