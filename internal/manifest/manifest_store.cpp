#include "manifest_store.hpp"

#include <arrow/io/file.h>
#include <arrow/memory_pool.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/fs/episode_paths.hpp"
#include "internal/fs/file_stat.hpp"
#include "internal/manifest/arrow_utils.hpp"
#include "internal/manifest/manifest_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/diagnostic.hpp"
#include "internal/util/errors.hpp"

namespace curator::manifest {

using model::Manifest;
using model::ManifestKey;
using model::ManifestRow;
using model::Status;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int64_t kRowGroupRows = 64 * 1024;

std::filesystem::path TempPath(const std::filesystem::path& path) {
  return path.string() + ".tmp";
}

void WriteParquet(const Manifest& manifest, const std::filesystem::path& tmp_path) {
  const auto table = ToTable(manifest);

  auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
  Unwrap(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), out, kRowGroupRows));
  Unwrap(out->Flush());

  if (::fsync(out->file_descriptor()) != 0) {
    throw std::runtime_error("fsync failed for " + tmp_path.string() + ": " + std::strerror(errno));
  }

  Unwrap(out->Close());
}

} // namespace

ManifestStore::ManifestStore(fs::FileSystemAdapterPtr fs) : fs_(std::move(fs)) {
}

std::optional<Manifest> ManifestStore::Load(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      exists = std::filesystem::exists(path, ec);
  if (ec) {
    throw util::ManifestReadError("cannot access manifest " + path.string() + ": " + ec.message());
  }
  if (!exists) {
    return std::nullopt;
  }

  try {
    auto infile = Unwrap(arrow::io::ReadableFile::Open(path.string()));

    parquet::arrow::FileReaderBuilder builder;
    Unwrap(builder.Open(infile));

    std::unique_ptr<parquet::arrow::FileReader> reader;
    Unwrap(builder.Build(&reader));

    std::shared_ptr<arrow::Table> table;
    Unwrap(reader->ReadTable(&table));

    auto manifest = FromTable(*table);
    CURATOR_LOG_DEBUG("manifest loaded", {StringField("path", path.string()), IntField("rows", static_cast<int64_t>(manifest.size()))});
    return manifest;
  } catch (const std::exception& e) {
    throw util::ManifestReadError("failed to read manifest " + path.string() + ": " + e.what());
  }
}

void ManifestStore::Persist(const Manifest& manifest, const std::filesystem::path& path) {
  const auto tmp_path = TempPath(path);

  try {
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }

    WriteParquet(manifest, tmp_path);

    // same directory as the target, so rename(2) is atomic
    std::filesystem::rename(tmp_path, path);
  } catch (const std::exception& e) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw util::ManifestWriteError("failed to persist manifest " + path.string() + ": " + e.what());
  }

  CURATOR_LOG_INFO("manifest persisted", {StringField("path", path.string()), IntField("rows", static_cast<int64_t>(manifest.size()))});
}

std::vector<ManifestRow> ManifestStore::DiffDeletions(const Manifest& previous, const std::set<ManifestKey>& current_keys,
                                                      const std::string& fingerprint_algo, const std::string& discovered_at) {
  std::vector<ManifestRow> deleted;

  for (const auto& [key, row] : previous.TrajectoryIndex()) {
    if (current_keys.count(key)) continue;

    ManifestRow tombstone;
    tombstone.episode_index    = key.episode_index;
    tombstone.chunk            = key.chunk;
    tombstone.fingerprint_algo = fingerprint_algo;
    tombstone.discovered_at    = discovered_at;
    tombstone.status           = Status::kDeleted;
    deleted.push_back(std::move(tombstone));
  }

  return deleted;
}

std::vector<ManifestRow> ManifestStore::DiffOrphans(const std::vector<std::string>& chunks, const std::set<ManifestKey>& current_keys,
                                                    const std::string& fingerprint_algo, const std::string& discovered_at) const {
  std::vector<ManifestRow> orphans;

  for (const auto& chunk : chunks) {
    for (auto view : model::kCameraViews) {
      for (const auto& video : fs_->ListVideoFiles(chunk, view)) {
        const auto episode_index = fs::ParseEpisodeIndex(video);
        if (!episode_index) continue;
        if (current_keys.count(ManifestKey{chunk, *episode_index})) continue;

        ManifestRow orphan;
        orphan.episode_index    = *episode_index;
        orphan.chunk            = chunk;
        orphan.fingerprint_algo = fingerprint_algo;
        orphan.discovered_at    = discovered_at;
        orphan.status           = Status::kOrphanVideo;

        switch (view) {
          case model::CameraView::kFront:
            orphan.video_front_uri = video.string();
            orphan.exists_front    = true;
            break;
          case model::CameraView::kWrist:
            orphan.video_wrist_uri = video.string();
            orphan.exists_wrist    = true;
            break;
        }

        try {
          const auto stat    = fs::StatFile(video);
          orphan.bytes_total = stat ? static_cast<int64_t>(stat->size) : 0;
        } catch (const util::IoError& e) {
          orphan.errors = util::MakeDiagnostic({{"reason", "stat_failed"}, {"path", video.string()}, {"message", e.what()}});
          CURATOR_LOG_WARN("orphan video stat failed", {StringField("path", video.string()), StringField("error", e.what())});
        }

        orphans.push_back(std::move(orphan));
      }
    }
  }

  return orphans;
}

std::vector<ManifestRow> ManifestStore::SelectActionable(const Manifest& manifest) {
  std::vector<ManifestRow> actionable;
  for (const auto& row : manifest.rows()) {
    if (model::IsActionable(row.status)) actionable.push_back(row);
  }
  return actionable;
}

} // namespace curator::manifest
