#pragma once

#include <filesystem>

#include "internal/fs/file_system.hpp"
#include "internal/fs/layout.hpp"

namespace curator::fs {

class LocalFileSystem final : public FileSystemAdapter {
 public:
  explicit LocalFileSystem(std::filesystem::path root, Layout layout = {});

  std::vector<std::string> ListChunks() const override;

  std::vector<std::string> ListVideoChunks() const override;

  std::vector<std::filesystem::path> ListTrajectoryFiles(const std::string& chunk) const override;

  std::vector<std::filesystem::path> ListVideoFiles(const std::string& chunk, model::CameraView view) const override;

  std::filesystem::path VideoPath(const std::string& chunk, model::CameraView view, int64_t episode_index) const override;

  bool Exists(const std::filesystem::path& path) const override;

  const std::filesystem::path& root() const {
    return root_;
  }
  const Layout& layout() const {
    return layout_;
  }

 private:
  std::filesystem::path ChunkDataDir(const std::string& chunk) const;
  std::filesystem::path ChunkVideoDir(const std::string& chunk) const;

  std::filesystem::path root_;
  Layout                layout_;
};

} // namespace curator::fs
