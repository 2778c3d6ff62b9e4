#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace curator::fs {

struct FileStat {
  uint64_t size     = 0;
  int64_t  mtime_ns = 0;

  bool operator==(const FileStat& other) const {
    return size == other.size && mtime_ns == other.mtime_ns;
  }
};

/*
  stat(2) of a regular file.

  Returns nullopt when the path does not exist (or vanished); throws
  util::IoError for any other failure.
*/
std::optional<FileStat> StatFile(const std::filesystem::path& path);

} // namespace curator::fs
