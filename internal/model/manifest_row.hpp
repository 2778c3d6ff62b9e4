#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

#include "internal/model/status.hpp"

namespace curator::model {

inline constexpr int64_t kUnparsedEpisodeIndex = -1;

struct ManifestKey {
  std::string chunk;
  int64_t     episode_index = kUnparsedEpisodeIndex;

  bool operator<(const ManifestKey& other) const {
    return std::tie(chunk, episode_index) < std::tie(other.chunk, other.episode_index);
  }
  bool operator==(const ManifestKey& other) const {
    return chunk == other.chunk && episode_index == other.episode_index;
  }
};

/*
  One episode as seen by one discovery run.

  DELETED and ORPHAN_VIDEO rows never carry a fingerprint. bytes_total is the
  sum of exactly the files that went into the fingerprint (orphans: the size
  of the orphaned video).
*/
struct ManifestRow {
  int64_t     episode_index = kUnparsedEpisodeIndex;
  std::string chunk;

  std::optional<std::string> parquet_uri;
  std::optional<std::string> video_front_uri;
  std::optional<std::string> video_wrist_uri;

  bool exists_front = false;
  bool exists_wrist = false;

  int64_t bytes_total = 0;

  std::optional<std::string> fingerprint;
  std::string                fingerprint_algo;

  std::string discovered_at;
  Status      status = Status::kError;

  // JSON object text
  std::optional<std::string> errors;

  ManifestKey Key() const {
    return {chunk, episode_index};
  }
};

// Equality on everything except discovered_at.
inline bool SameContent(const ManifestRow& a, const ManifestRow& b) {
  return a.episode_index == b.episode_index && a.chunk == b.chunk && a.parquet_uri == b.parquet_uri &&
         a.video_front_uri == b.video_front_uri && a.video_wrist_uri == b.video_wrist_uri && a.exists_front == b.exists_front &&
         a.exists_wrist == b.exists_wrist && a.bytes_total == b.bytes_total && a.fingerprint == b.fingerprint &&
         a.fingerprint_algo == b.fingerprint_algo && a.status == b.status && a.errors == b.errors;
}

} // namespace curator::model
