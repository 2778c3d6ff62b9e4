#pragma once

#include <string>

#include "internal/model/camera.hpp"

namespace curator::fs {

/*
  Naming of the on-disk dataset tree:

      <root>/data/chunk-<chunk>/episode_<NNNNNN><trajectory_extension>
      <root>/videos/chunk-<chunk>/<camera dir>/episode_<NNNNNN>.mp4
*/
struct Layout {
  std::string trajectory_extension = ".parquet";
  std::string front_camera_dir     = "observation.images.front";
  std::string wrist_camera_dir     = "observation.images.wrist";

  const std::string& CameraDir(model::CameraView view) const {
    switch (view) {
      case model::CameraView::kFront:
        return front_camera_dir;
      case model::CameraView::kWrist:
        return wrist_camera_dir;
    }
    return front_camera_dir;
  }
};

inline constexpr const char* kDataDir        = "data";
inline constexpr const char* kVideosDir      = "videos";
inline constexpr const char* kChunkPrefix    = "chunk-";
inline constexpr const char* kEpisodePrefix  = "episode_";
inline constexpr const char* kVideoExtension = ".mp4";

} // namespace curator::fs
