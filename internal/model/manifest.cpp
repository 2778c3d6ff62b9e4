#include "manifest.hpp"

#include <algorithm>
#include <tuple>

namespace curator::model {

namespace {

int CameraRank(const ManifestRow& row) {
  if (row.status != Status::kOrphanVideo) return 0;
  return row.exists_front ? 1 : 2;
}

} // namespace

void Manifest::SortDeterministic() {
  std::stable_sort(rows_.begin(), rows_.end(), [](const ManifestRow& a, const ManifestRow& b) {
    const auto a_uri = a.parquet_uri.value_or("");
    const auto b_uri = b.parquet_uri.value_or("");
    return std::forward_as_tuple(a.chunk, a.episode_index, CameraRank(a), a_uri) <
           std::forward_as_tuple(b.chunk, b.episode_index, CameraRank(b), b_uri);
  });
}

std::map<ManifestKey, const ManifestRow*> Manifest::TrajectoryIndex() const {
  std::map<ManifestKey, const ManifestRow*> index;
  for (const auto& row : rows_) {
    if (row.episode_index < 0 || !IsTrajectoryBearing(row.status)) continue;
    index.emplace(row.Key(), &row);
  }
  return index;
}

} // namespace curator::model
