#include "internal/manifest/manifest_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/fs/local_file_system.hpp"
#include "internal/util/errors.hpp"
#include "support/episode_tree.hpp"

namespace {

using curator::manifest::ManifestStore;
using curator::model::Manifest;
using curator::model::ManifestKey;
using curator::model::ManifestRow;
using curator::model::Status;
using curator::testing::EpisodeTree;

constexpr const char* kAlgo = "size+mtime+sha256(head|tail:65536)-v1";
constexpr const char* kWhen = "2024-05-01T00:00:00.000000Z";

ManifestRow Row(const std::string& chunk, int64_t episode_index, Status status) {
  ManifestRow row;
  row.chunk            = chunk;
  row.episode_index    = episode_index;
  row.status           = status;
  row.fingerprint_algo = kAlgo;
  row.discovered_at    = kWhen;
  return row;
}

Manifest SampleManifest() {
  Manifest manifest;

  auto complete            = Row("000", 1, Status::kNew);
  complete.parquet_uri     = "/d/data/chunk-000/episode_000001.parquet";
  complete.video_front_uri = "/d/videos/chunk-000/observation.images.front/episode_000001.mp4";
  complete.video_wrist_uri = "/d/videos/chunk-000/observation.images.wrist/episode_000001.mp4";
  complete.exists_front    = true;
  complete.exists_wrist    = true;
  complete.bytes_total     = 12345;
  complete.fingerprint     = std::string(64, 'a');
  manifest.Append(complete);

  auto broken        = Row("000", -1, Status::kError);
  broken.parquet_uri = "/d/data/chunk-000/episode_x.parquet";
  broken.errors      = R"({"reason":"bad_episode_name"})";
  manifest.Append(broken);

  manifest.Append(Row("001", 4, Status::kDeleted));
  return manifest;
}

void TestFirstRunHasNoManifest() {
  EpisodeTree tree("store_first_run");
  assert(!ManifestStore::Load(tree.ManifestPath()));
}

void TestPersistThenLoad() {
  EpisodeTree tree("store_persist");
  const auto  manifest = SampleManifest();

  ManifestStore::Persist(manifest, tree.ManifestPath());
  assert(std::filesystem::exists(tree.ManifestPath()));
  assert(!std::filesystem::exists(tree.ManifestPath().string() + ".tmp"));

  const auto loaded = ManifestStore::Load(tree.ManifestPath());
  assert(loaded);
  assert(loaded->size() == manifest.size());
  for (size_t i = 0; i < manifest.size(); ++i) {
    assert(curator::model::SameContent(loaded->rows()[i], manifest.rows()[i]));
    assert(loaded->rows()[i].discovered_at == manifest.rows()[i].discovered_at);
  }
}

void TestEmptyManifestPersists() {
  EpisodeTree tree("store_empty");
  ManifestStore::Persist(Manifest{}, tree.ManifestPath());

  const auto loaded = ManifestStore::Load(tree.ManifestPath());
  assert(loaded && loaded->empty());
}

void TestCorruptManifestIsReadError() {
  EpisodeTree tree("store_corrupt");
  EpisodeTree::Write(tree.ManifestPath(), "definitely not parquet");

  bool threw = false;
  try {
    (void)ManifestStore::Load(tree.ManifestPath());
  } catch (const curator::util::ManifestReadError&) {
    threw = true;
  }
  assert(threw);
}

void TestFailedPersistLeavesOldSnapshot() {
  EpisodeTree tree("store_atomic");
  const auto  before = SampleManifest();
  ManifestStore::Persist(before, tree.ManifestPath());

  // a directory squatting on the temp path makes the write fail
  const auto tmp_path = std::filesystem::path(tree.ManifestPath().string() + ".tmp");
  std::filesystem::create_directories(tmp_path / "blocker");

  Manifest replacement;
  replacement.Append(Row("009", 9, Status::kNew));

  bool threw = false;
  try {
    ManifestStore::Persist(replacement, tree.ManifestPath());
  } catch (const curator::util::ManifestWriteError&) {
    threw = true;
  }
  assert(threw);

  const auto loaded = ManifestStore::Load(tree.ManifestPath());
  assert(loaded && loaded->size() == before.size());
  assert(loaded->rows()[0].chunk == "000");
}

void TestDiffDeletions() {
  Manifest previous;
  previous.Append(Row("000", 1, Status::kUnchanged));
  previous.Append(Row("000", 2, Status::kNew));
  previous.Append(Row("000", 3, Status::kDeleted));
  previous.Append(Row("000", 4, Status::kOrphanVideo));
  previous.Append(Row("000", -1, Status::kError));

  const std::set<ManifestKey> current{{"000", 1}};
  const auto                  deleted = ManifestStore::DiffDeletions(previous, current, kAlgo, kWhen);

  // already-deleted, orphan and unparsed rows are not re-reported
  assert(deleted.size() == 1);
  assert(deleted[0].episode_index == 2);
  assert(deleted[0].status == Status::kDeleted);
  assert(!deleted[0].fingerprint && !deleted[0].parquet_uri);
  assert(deleted[0].bytes_total == 0);
}

void TestDiffOrphansOneRowPerCamera() {
  using curator::model::CameraView;

  EpisodeTree tree("store_orphans");
  tree.WriteEpisode("000", 1);
  tree.WriteVideo("000", CameraView::kFront, 2, "front-only");
  tree.WriteVideo("000", CameraView::kFront, 3, "both");
  tree.WriteVideo("000", CameraView::kWrist, 3, "both!");

  ManifestStore store(std::make_shared<curator::fs::LocalFileSystem>(tree.root()));
  const std::set<ManifestKey> current{{"000", 1}};
  auto                        orphans = store.DiffOrphans({"000"}, current, kAlgo, kWhen);

  assert(orphans.size() == 3);
  Manifest sorted(orphans);
  sorted.SortDeterministic();
  const auto& rows = sorted.rows();

  assert(rows[0].episode_index == 2 && rows[0].exists_front && !rows[0].exists_wrist);
  assert(rows[0].bytes_total == static_cast<int64_t>(std::string("front-only").size()));
  assert(rows[1].episode_index == 3 && rows[1].exists_front && rows[1].video_front_uri);
  assert(rows[2].episode_index == 3 && rows[2].exists_wrist && rows[2].video_wrist_uri && !rows[2].video_front_uri);
  assert(rows[2].bytes_total == 5);
  for (const auto& row : rows) {
    assert(row.status == Status::kOrphanVideo);
    assert(!row.fingerprint && !row.parquet_uri);
  }
}

void TestSelectActionable() {
  Manifest manifest;
  manifest.Append(Row("000", 1, Status::kUnchanged));
  manifest.Append(Row("000", 2, Status::kNew));
  manifest.Append(Row("000", 3, Status::kPending));

  const auto actionable = ManifestStore::SelectActionable(manifest);
  assert(actionable.size() == 2);
  assert(actionable[0].episode_index == 2);
  assert(actionable[1].episode_index == 3);
}

} // namespace

int main() {
  TestFirstRunHasNoManifest();
  TestPersistThenLoad();
  TestEmptyManifestPersists();
  TestCorruptManifestIsReadError();
  TestFailedPersistLeavesOldSnapshot();
  TestDiffDeletions();
  TestDiffOrphansOneRowPerCamera();
  TestSelectActionable();

  std::cout << "curator_unit_manifest_store: pass\n";
  return 0;
}
