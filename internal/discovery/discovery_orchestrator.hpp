#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/fingerprint/fingerprinter.hpp"
#include "internal/fingerprint/stability_checker.hpp"
#include "internal/fs/file_system.hpp"
#include "internal/fs/layout.hpp"
#include "internal/model/manifest_row.hpp"
#include "internal/util/time.hpp"

namespace curator::discovery {

struct DiscoveryOptions {
  std::filesystem::path data_root;
  std::filesystem::path manifest_path;

  // clamped to [1, 64]
  long long workers = 16;

  // inclusive lower bound on trajectory file mtime
  std::optional<util::TimePoint> since;

  bool full_hash = false;

  // empty = every chunk under <data_root>/data
  std::vector<std::string> only_chunks;
};

using FileSystemFactory = std::function<fs::FileSystemAdapterPtr(const std::filesystem::path& data_root, const fs::Layout& layout)>;

// Tunables that do not change per run.
struct DiscoverySettings {
  fs::Layout                    layout;
  fingerprint::Fingerprinter    fingerprinter;
  fingerprint::StabilityChecker stability;

  // empty = fs::LocalFileSystem
  FileSystemFactory file_system_factory;
};

struct DiscoveryReport {
  // rows of the persisted manifest that need downstream processing
  std::vector<model::ManifestRow> actionable;

  // over the whole persisted manifest
  std::map<model::Status, size_t> status_counts;

  size_t  manifest_rows       = 0;
  size_t  scanned_files       = 0;
  size_t  carried_rows        = 0;
  int64_t bytes_fingerprinted = 0;
  int64_t elapsed_ms          = 0;
};

/*
  One discovery pass over a data tree.

      load previous → enumerate → [pool] probe episodes → reconcile
        → deletions + orphans → sort → persist → actionable rows

  The only parallel region is the probe fan-out. Reconciliation against the
  previous manifest is a single-threaded pass after fan-in. A failure before
  Persist leaves the old snapshot in place.
*/
class DiscoveryOrchestrator {
 public:
  explicit DiscoveryOrchestrator(DiscoverySettings settings = {});

  DiscoveryReport Run(const DiscoveryOptions& options) const;

 private:
  DiscoverySettings settings_;
};

} // namespace curator::discovery
