#include "episode_probe.hpp"

#include <exception>

#include "internal/fs/episode_paths.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/diagnostic.hpp"
#include "internal/util/time.hpp"

namespace curator::discovery {

using observability::StringField;

EpisodeProbe::EpisodeProbe(fs::FileSystemAdapterPtr fs, fingerprint::Fingerprinter fingerprinter, fingerprint::StabilityChecker stability,
                           bool full_hash)
    : fs_(std::move(fs)), fingerprinter_(fingerprinter), stability_(stability), full_hash_(full_hash) {
}

EpisodeObservation EpisodeProbe::Observe(const std::string& chunk, const std::filesystem::path& trajectory) const {
  EpisodeObservation observation;
  observation.chunk           = chunk;
  observation.observed_at     = util::ToIso8601(util::Now());
  observation.trajectory.path = trajectory;

  observation.episode_index = fs::ParseEpisodeIndex(trajectory);
  if (!observation.episode_index) {
    observation.error = util::MakeDiagnostic({{"reason", "bad_episode_name"}, {"path", trajectory.string()}});
    return observation;
  }

  try {
    observation.front.path = fs_->VideoPath(chunk, model::CameraView::kFront, *observation.episode_index);
    observation.wrist.path = fs_->VideoPath(chunk, model::CameraView::kWrist, *observation.episode_index);

    for (auto* file : {&observation.trajectory, &observation.front, &observation.wrist}) {
      file->exists = fs_->Exists(file->path);
      if (file->exists) {
        file->stable = stability_.IsStable(file->path);
      }
    }

    Fingerprint(observation);
  } catch (const std::exception& e) {
    observation.fingerprint.reset();
    observation.bytes_total = 0;
    observation.error       = util::MakeDiagnostic({{"reason", "fingerprint_failed"}, {"path", trajectory.string()}, {"message", e.what()}});
    CURATOR_LOG_WARN("episode fingerprint failed", {StringField("chunk", chunk), StringField("path", trajectory.string()),
                                                    StringField("error", e.what())});
  }

  return observation;
}

/*
  The trajectory file is required even if it vanished after listing; videos
  take part only when present.
*/
void EpisodeProbe::Fingerprint(EpisodeObservation& observation) const {
  fingerprint::FingerprintParts parts;
  parts.emplace("parquet", fingerprinter_.FingerprintFile(observation.trajectory.path, full_hash_));

  const struct {
    model::CameraView view;
    FileObservation*  file;
  } videos[] = {{model::CameraView::kFront, &observation.front}, {model::CameraView::kWrist, &observation.wrist}};

  for (const auto& video : videos) {
    if (!video.file->exists) continue;
    parts.emplace(std::string(model::ToString(video.view)), fingerprinter_.FingerprintFile(video.file->path, full_hash_));
  }

  int64_t bytes_total = 0;
  for (const auto& [name, part] : parts) {
    bytes_total += static_cast<int64_t>(part.size);
  }

  observation.fingerprint = fingerprint::Fingerprinter::Combine(parts);
  observation.bytes_total = bytes_total;
}

} // namespace curator::discovery
