#include "file_stat.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "internal/util/errors.hpp"

namespace curator::fs {

std::optional<FileStat> StatFile(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return std::nullopt;
    }
    throw util::IoError("stat failed for " + path.string() + ": " + std::strerror(errno));
  }

  FileStat result;
  result.size     = static_cast<uint64_t>(st.st_size);
  result.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL + st.st_mtim.tv_nsec;
  return result;
}

} // namespace curator::fs
