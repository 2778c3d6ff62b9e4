#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace curator::discovery {

struct FileObservation {
  std::filesystem::path path;
  bool                  exists = false;
  bool                  stable = true;
};

/*
  Everything one fingerprinting task learns about one episode.

  Owned by the task until it is handed to the result channel; carries no
  reference to shared state.
*/
struct EpisodeObservation {
  std::string chunk;
  std::string observed_at;

  // nullopt when the trajectory file name has no parseable index
  std::optional<int64_t> episode_index;

  FileObservation trajectory;
  FileObservation front;
  FileObservation wrist;

  std::optional<std::string> fingerprint;
  int64_t                    bytes_total = 0;

  // JSON diagnostic; set when the episode could not be fingerprinted
  std::optional<std::string> error;

  bool Pending() const {
    return (trajectory.exists && !trajectory.stable) || (front.exists && !front.stable) || (wrist.exists && !wrist.stable);
  }
};

} // namespace curator::discovery
