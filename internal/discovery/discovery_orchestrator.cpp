#include "discovery_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <set>
#include <tuple>
#include <utility>

#include "internal/concurrency/blocking_queue.hpp"
#include "internal/concurrency/worker_pool.hpp"
#include "internal/discovery/episode_probe.hpp"
#include "internal/discovery/status_resolver.hpp"
#include "internal/fs/episode_paths.hpp"
#include "internal/fs/file_stat.hpp"
#include "internal/fs/local_file_system.hpp"
#include "internal/manifest/manifest_store.hpp"
#include "internal/model/manifest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/diagnostic.hpp"
#include "internal/util/errors.hpp"

namespace curator::discovery {

using manifest::ManifestStore;
using model::Manifest;
using model::ManifestKey;
using model::ManifestRow;
using model::Status;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

struct Candidate {
  std::string           chunk;
  std::filesystem::path trajectory;
};

/*
  A row copied from the previous snapshot without being re-observed.
  Content already reported as NEW/CHANGED is not reported again.
*/
ManifestRow CarryForward(ManifestRow row) {
  switch (row.status) {
    case Status::kNew:
    case Status::kChanged:
      if (row.fingerprint) row.status = Status::kUnchanged;
      break;
    case Status::kUnchanged:
    case Status::kMissingSide:
    case Status::kDeleted:
    case Status::kOrphanVideo:
    case Status::kPending:
    case Status::kError:
      break;
  }
  return row;
}

std::vector<std::string> TargetChunks(const fs::FileSystemAdapter& file_system, const std::vector<std::string>& only_chunks) {
  if (only_chunks.empty()) {
    return file_system.ListChunks();
  }
  std::set<std::string> unique(only_chunks.begin(), only_chunks.end());
  return {unique.begin(), unique.end()};
}

EpisodeObservation TaskFailure(const Candidate& candidate, const std::string& message) {
  EpisodeObservation failed;
  failed.chunk           = candidate.chunk;
  failed.observed_at     = util::ToIso8601(util::Now());
  failed.trajectory.path = candidate.trajectory;
  failed.episode_index   = fs::ParseEpisodeIndex(candidate.trajectory);
  failed.error           = util::MakeDiagnostic({{"reason", "task_failed"}, {"path", candidate.trajectory.string()}, {"message", message}});
  return failed;
}

void Validate(const DiscoveryOptions& options) {
  if (options.data_root.empty()) {
    throw util::InvalidArgument("data_root must not be empty");
  }
  if (options.manifest_path.empty()) {
    throw util::InvalidArgument("manifest_path must not be empty");
  }
}

} // namespace

DiscoveryOrchestrator::DiscoveryOrchestrator(DiscoverySettings settings) : settings_(std::move(settings)) {
}

DiscoveryReport DiscoveryOrchestrator::Run(const DiscoveryOptions& options) const {
  Validate(options);
  const auto started = std::chrono::steady_clock::now();

  const auto workers = concurrency::WorkerPool::ClampWorkers(options.workers);
  if (static_cast<long long>(workers) != options.workers) {
    CURATOR_LOG_WARN("worker count clamped", {IntField("requested", options.workers), IntField("workers", static_cast<int64_t>(workers))});
  }

  // ------------------------------------------------------------
  // Previous snapshot (fatal if present but unreadable)
  // ------------------------------------------------------------
  const auto previous       = ManifestStore::Load(options.manifest_path);
  const auto previous_index = previous ? previous->TrajectoryIndex() : std::map<ManifestKey, const ManifestRow*>{};

  const fs::FileSystemAdapterPtr file_system = settings_.file_system_factory
                                                    ? settings_.file_system_factory(options.data_root, settings_.layout)
                                                    : std::make_shared<fs::LocalFileSystem>(options.data_root, settings_.layout);
  const ManifestStore            store(file_system);
  const auto                     algo = settings_.fingerprinter.AlgorithmTag(options.full_hash);

  const auto chunks = TargetChunks(*file_system, options.only_chunks);
  const std::set<std::string> chunk_set(chunks.begin(), chunks.end());

  CURATOR_LOG_INFO("discovery started", {StringField("data_root", options.data_root.string()),
                                         StringField("manifest", options.manifest_path.string()), IntField("workers", static_cast<int64_t>(workers)),
                                         IntField("chunks", static_cast<int64_t>(chunks.size())), BoolField("full_hash", options.full_hash),
                                         BoolField("first_run", !previous.has_value())});

  // ------------------------------------------------------------
  // Enumerate
  // ------------------------------------------------------------
  std::vector<Candidate> candidates;
  std::vector<Candidate> skipped_by_since;

  for (const auto& chunk : chunks) {
    for (auto& trajectory : file_system->ListTrajectoryFiles(chunk)) {
      if (options.since) {
        std::optional<fs::FileStat> stat;
        try {
          stat = fs::StatFile(trajectory);
        } catch (const util::IoError& e) {
          // let the probe record it as a row-local error
          CURATOR_LOG_WARN("stat failed during since filter", {StringField("path", trajectory.string()), StringField("error", e.what())});
          candidates.push_back({chunk, std::move(trajectory)});
          continue;
        }
        if (!stat) continue;
        if (stat->mtime_ns < util::ToUnixNanos(*options.since)) {
          skipped_by_since.push_back({chunk, std::move(trajectory)});
          continue;
        }
      }
      candidates.push_back({chunk, std::move(trajectory)});
    }
  }

  // ------------------------------------------------------------
  // Fan-out / fan-in
  // ------------------------------------------------------------
  auto probe = std::make_shared<const EpisodeProbe>(file_system, settings_.fingerprinter, settings_.stability, options.full_hash);

  concurrency::BlockingQueue<EpisodeObservation> results;
  std::vector<EpisodeObservation>                observations;
  observations.reserve(candidates.size());
  {
    concurrency::WorkerPool pool(workers);
    for (const auto& candidate : candidates) {
      pool.Submit([probe, candidate, &results] {
        try {
          results.Enqueue(probe->Observe(candidate.chunk, candidate.trajectory));
        } catch (const std::exception& e) {
          results.Enqueue(TaskFailure(candidate, e.what()));
        } catch (...) {
          // every task must answer, or the fan-in below waits forever
          results.Enqueue(TaskFailure(candidate, "unknown exception"));
        }
      });
    }

    // completion order; the final order comes from the sort below
    for (size_t i = 0; i < candidates.size(); ++i) {
      auto observation = results.Dequeue();
      if (!observation) break;
      observations.push_back(std::move(*observation));
    }
  }

  // ------------------------------------------------------------
  // Reconcile against the previous run (single-threaded)
  // ------------------------------------------------------------
  const StatusResolver resolver(algo);

  Manifest              next;
  std::set<ManifestKey> trajectory_keys;
  DiscoveryReport       report;
  report.scanned_files = candidates.size();

  // path order decides which of two files sharing an index keeps the key
  std::sort(observations.begin(), observations.end(), [](const EpisodeObservation& a, const EpisodeObservation& b) {
    return std::tie(a.chunk, a.trajectory.path) < std::tie(b.chunk, b.trajectory.path);
  });

  for (auto& observation : observations) {
    const ManifestRow* prev = nullptr;
    if (observation.episode_index) {
      const ManifestKey key{observation.chunk, *observation.episode_index};
      if (!trajectory_keys.insert(key).second) {
        observation.fingerprint.reset();
        observation.bytes_total = 0;
        observation.error =
            util::MakeDiagnostic({{"reason", "duplicate_episode_index"}, {"path", observation.trajectory.path.string()}});
      } else if (auto it = previous_index.find(key); it != previous_index.end()) {
        prev = it->second;
      }
    }

    auto row = resolver.BuildRow(observation, prev, observation.observed_at);
    if (row.status == Status::kError) {
      CURATOR_LOG_WARN("episode error", {StringField("chunk", row.chunk), IntField("episode_index", row.episode_index),
                                         StringField("errors", row.errors.value_or(""))});
    }
    report.bytes_fingerprinted += row.bytes_total;
    next.Append(std::move(row));
  }

  // ------------------------------------------------------------
  // Carry forward what this run deliberately did not look at
  // ------------------------------------------------------------
  if (previous) {
    if (!options.only_chunks.empty()) {
      for (const auto& row : previous->rows()) {
        if (chunk_set.count(row.chunk) || row.status == Status::kDeleted) continue;
        if (row.episode_index >= 0 && model::IsTrajectoryBearing(row.status)) trajectory_keys.insert(row.Key());
        next.Append(CarryForward(row));
        ++report.carried_rows;
      }
    }

    for (const auto& skipped : skipped_by_since) {
      const auto episode_index = fs::ParseEpisodeIndex(skipped.trajectory);
      if (!episode_index) continue;
      const ManifestKey key{skipped.chunk, *episode_index};
      if (auto it = previous_index.find(key); it != previous_index.end()) {
        next.Append(CarryForward(*it->second));
        ++report.carried_rows;
      }
    }
  }

  // a trajectory skipped by `since` still owns its videos
  for (const auto& skipped : skipped_by_since) {
    if (const auto episode_index = fs::ParseEpisodeIndex(skipped.trajectory)) {
      trajectory_keys.insert(ManifestKey{skipped.chunk, *episode_index});
    }
  }

  // ------------------------------------------------------------
  // Deletions and orphans
  // ------------------------------------------------------------
  const auto diffed_at = util::ToIso8601(util::Now());

  if (previous) {
    for (auto& row : ManifestStore::DiffDeletions(*previous, trajectory_keys, algo, diffed_at)) {
      next.Append(std::move(row));
    }
  }
  // a full scan also looks at video chunks that have no data directory
  auto orphan_chunks = chunks;
  if (options.only_chunks.empty()) {
    for (auto& chunk : file_system->ListVideoChunks()) {
      if (!chunk_set.count(chunk)) orphan_chunks.push_back(std::move(chunk));
    }
  }
  for (auto& row : store.DiffOrphans(orphan_chunks, trajectory_keys, algo, diffed_at)) {
    next.Append(std::move(row));
  }

  next.SortDeterministic();

  // ------------------------------------------------------------
  // Persist, then report
  // ------------------------------------------------------------
  ManifestStore::Persist(next, options.manifest_path);

  report.actionable    = ManifestStore::SelectActionable(next);
  report.manifest_rows = next.size();
  for (const auto& row : next.rows()) {
    ++report.status_counts[row.status];
  }
  report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

  CURATOR_LOG_INFO("discovery finished",
                   {IntField("scanned", static_cast<int64_t>(report.scanned_files)), IntField("rows", static_cast<int64_t>(report.manifest_rows)),
                    IntField("actionable", static_cast<int64_t>(report.actionable.size())),
                    IntField("carried", static_cast<int64_t>(report.carried_rows)), IntField("bytes", report.bytes_fingerprinted),
                    IntField("elapsed_ms", report.elapsed_ms)});

  return report;
}

} // namespace curator::discovery
