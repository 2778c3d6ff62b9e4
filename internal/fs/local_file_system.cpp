#include "local_file_system.hpp"

#include <algorithm>
#include <system_error>

#include "internal/fs/episode_paths.hpp"

namespace curator::fs {

namespace {

/*
  Regular files in dir whose name matches episode_*<extension>, sorted.
  A missing or unreadable directory yields an empty list.
*/
std::vector<std::filesystem::path> ListEpisodeFiles(const std::filesystem::path& dir, const std::string& extension) {
  std::vector<std::filesystem::path> files;

  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return files;
  }

  for (const auto& entry : it) {
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec) || type_ec) continue;
    if (!MatchesEpisodeFile(entry.path(), extension)) continue;
    files.push_back(entry.path());
  }

  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
  return files;
}

/*
  Ids of chunk-<id> directories directly under dir, sorted.
*/
std::vector<std::string> ListChunkIds(const std::filesystem::path& dir) {
  std::vector<std::string> chunks;

  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return chunks;
  }

  const std::string prefix(kChunkPrefix);
  for (const auto& entry : it) {
    std::error_code type_ec;
    if (!entry.is_directory(type_ec) || type_ec) continue;

    const auto name = entry.path().filename().string();
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) continue;
    chunks.push_back(name.substr(prefix.size()));
  }

  std::sort(chunks.begin(), chunks.end());
  return chunks;
}

} // namespace

LocalFileSystem::LocalFileSystem(std::filesystem::path root, Layout layout) : root_(std::move(root)), layout_(std::move(layout)) {
}

std::filesystem::path LocalFileSystem::ChunkDataDir(const std::string& chunk) const {
  return root_ / kDataDir / (std::string(kChunkPrefix) + chunk);
}

std::filesystem::path LocalFileSystem::ChunkVideoDir(const std::string& chunk) const {
  return root_ / kVideosDir / (std::string(kChunkPrefix) + chunk);
}

std::vector<std::string> LocalFileSystem::ListChunks() const {
  return ListChunkIds(root_ / kDataDir);
}

std::vector<std::string> LocalFileSystem::ListVideoChunks() const {
  return ListChunkIds(root_ / kVideosDir);
}

std::vector<std::filesystem::path> LocalFileSystem::ListTrajectoryFiles(const std::string& chunk) const {
  return ListEpisodeFiles(ChunkDataDir(chunk), layout_.trajectory_extension);
}

std::vector<std::filesystem::path> LocalFileSystem::ListVideoFiles(const std::string& chunk, model::CameraView view) const {
  return ListEpisodeFiles(ChunkVideoDir(chunk) / layout_.CameraDir(view), kVideoExtension);
}

std::filesystem::path LocalFileSystem::VideoPath(const std::string& chunk, model::CameraView view, int64_t episode_index) const {
  return ChunkVideoDir(chunk) / layout_.CameraDir(view) / EpisodeFileName(episode_index, kVideoExtension);
}

bool LocalFileSystem::Exists(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

} // namespace curator::fs
