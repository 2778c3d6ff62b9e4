#include "stability_checker.hpp"

#include <thread>

#include "internal/fs/file_stat.hpp"

namespace curator::fingerprint {

StabilityChecker::StabilityChecker(uint64_t min_bytes, std::chrono::milliseconds pause) : min_bytes_(min_bytes), pause_(pause) {
}

bool StabilityChecker::IsStable(const std::filesystem::path& path) const {
  const auto first = fs::StatFile(path);
  if (!first) {
    return false;
  }
  if (first->size < min_bytes_) {
    return true;
  }

  std::this_thread::sleep_for(pause_);

  const auto second = fs::StatFile(path);
  if (!second) {
    return false;
  }
  return *first == *second;
}

} // namespace curator::fingerprint
