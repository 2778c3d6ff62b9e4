#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/camera.hpp"

namespace curator::fs {

/*
  Dataset tree abstraction.

  Enumeration only: none of these throw for paths that do not exist, they
  return an empty listing. Existence of individual files is the caller's
  concern.

  Implementations:
    LOCAL    → std::filesystem
*/
class FileSystemAdapter {
 public:
  virtual ~FileSystemAdapter() = default;

  // Chunk ids (the part after "chunk-"), lexicographically sorted.
  virtual std::vector<std::string> ListChunks() const = 0;

  // Chunk ids that have a directory under <root>/videos, sorted.
  virtual std::vector<std::string> ListVideoChunks() const = 0;

  // Trajectory files of one chunk, sorted by file name.
  virtual std::vector<std::filesystem::path> ListTrajectoryFiles(const std::string& chunk) const = 0;

  // Video files of one camera view of one chunk, sorted by file name.
  virtual std::vector<std::filesystem::path> ListVideoFiles(const std::string& chunk, model::CameraView view) const = 0;

  // Expected video location. Pure: performs no I/O.
  virtual std::filesystem::path VideoPath(const std::string& chunk, model::CameraView view, int64_t episode_index) const = 0;

  virtual bool Exists(const std::filesystem::path& path) const = 0;
};

using FileSystemAdapterPtr = std::shared_ptr<FileSystemAdapter>;

} // namespace curator::fs
