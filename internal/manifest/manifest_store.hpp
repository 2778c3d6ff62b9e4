#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/fs/file_system.hpp"
#include "internal/model/manifest.hpp"

namespace curator::manifest {

/*
  Snapshot persistence and run-to-run diffing.

  The previous snapshot is always passed in explicitly; the store keeps no
  state between runs apart from the adapter it lists videos through.
*/
class ManifestStore {
 public:
  explicit ManifestStore(fs::FileSystemAdapterPtr fs);

  // nullopt on first run. Throws util::ManifestReadError if the file exists
  // but cannot be read or decoded.
  static std::optional<model::Manifest> Load(const std::filesystem::path& path);

  /*
    Atomic replace:
        write <path>.tmp → fsync → rename over <path>

    Readers of path observe either the old or the new snapshot. Throws
    util::ManifestWriteError; the old snapshot is left untouched.
  */
  static void Persist(const model::Manifest& manifest, const std::filesystem::path& path);

  // Previously-known trajectory keys missing from current_keys, as DELETED rows.
  static std::vector<model::ManifestRow> DiffDeletions(const model::Manifest& previous, const std::set<model::ManifestKey>& current_keys,
                                                       const std::string& fingerprint_algo, const std::string& discovered_at);

  // One ORPHAN_VIDEO row per video file whose key has no trajectory file.
  std::vector<model::ManifestRow> DiffOrphans(const std::vector<std::string>& chunks, const std::set<model::ManifestKey>& current_keys,
                                              const std::string& fingerprint_algo, const std::string& discovered_at) const;

  // Every row except UNCHANGED.
  static std::vector<model::ManifestRow> SelectActionable(const model::Manifest& manifest);

 private:
  fs::FileSystemAdapterPtr fs_;
};

} // namespace curator::manifest
