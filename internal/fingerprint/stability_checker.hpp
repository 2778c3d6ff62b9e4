#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace curator::fingerprint {

/*
  Heuristic check for files still being written by the recorder.

  Files below min_bytes are assumed to be written atomically. Larger files
  are sampled twice, pause apart; size and mtime must both be unchanged.
  This narrows the race with an external writer, it does not close it.
*/
class StabilityChecker {
 public:
  static constexpr uint64_t                  kDefaultMinBytes = 50ull * 1024 * 1024;
  static constexpr std::chrono::milliseconds kDefaultPause{150};

  StabilityChecker() = default;
  StabilityChecker(uint64_t min_bytes, std::chrono::milliseconds pause);

  // False when the file disappears between samples.
  bool IsStable(const std::filesystem::path& path) const;

  uint64_t min_bytes() const {
    return min_bytes_;
  }
  std::chrono::milliseconds pause() const {
    return pause_;
  }

 private:
  uint64_t                  min_bytes_ = kDefaultMinBytes;
  std::chrono::milliseconds pause_     = kDefaultPause;
};

} // namespace curator::fingerprint
