#include "status_resolver.hpp"

namespace curator::discovery {

using model::ManifestRow;
using model::Status;

namespace {

/*
  Whether a previous row's fingerprint describes settled content. A PENDING
  fingerprint may have been taken mid-write, so the episode has not been
  reported yet.
*/
bool IsBaseline(const ManifestRow& previous) {
  if (!previous.fingerprint) return false;
  switch (previous.status) {
    case Status::kNew:
    case Status::kChanged:
    case Status::kUnchanged:
    case Status::kMissingSide:
      return true;
    case Status::kPending:
    case Status::kError:
    case Status::kDeleted:
    case Status::kOrphanVideo:
      return false;
  }
  return false;
}

} // namespace

StatusResolver::StatusResolver(std::string fingerprint_algo) : fingerprint_algo_(std::move(fingerprint_algo)) {
}

Status StatusResolver::Resolve(const EpisodeObservation& observation, const ManifestRow* previous) const {
  if (!observation.episode_index || observation.error || !observation.fingerprint) {
    return Status::kError;
  }

  if (observation.Pending()) {
    return Status::kPending;
  }

  if (!observation.front.exists || !observation.wrist.exists) {
    return Status::kMissingSide;
  }

  if (previous == nullptr || !IsBaseline(*previous)) {
    return Status::kNew;
  }
  if (previous->fingerprint_algo != fingerprint_algo_) {
    return Status::kChanged;
  }
  return *previous->fingerprint == *observation.fingerprint ? Status::kUnchanged : Status::kChanged;
}

ManifestRow StatusResolver::BuildRow(const EpisodeObservation& observation, const ManifestRow* previous,
                                     const std::string& discovered_at) const {
  ManifestRow row;
  row.episode_index    = observation.episode_index.value_or(model::kUnparsedEpisodeIndex);
  row.chunk            = observation.chunk;
  row.parquet_uri      = observation.trajectory.path.string();
  row.fingerprint_algo = fingerprint_algo_;
  row.discovered_at    = discovered_at;
  row.status           = Resolve(observation, previous);

  row.exists_front = observation.front.exists;
  row.exists_wrist = observation.wrist.exists;
  if (observation.front.exists) row.video_front_uri = observation.front.path.string();
  if (observation.wrist.exists) row.video_wrist_uri = observation.wrist.path.string();

  if (row.status == Status::kError) {
    row.errors = observation.error;
    return row;
  }

  row.fingerprint = observation.fingerprint;
  row.bytes_total = observation.bytes_total;
  return row;
}

} // namespace curator::discovery
