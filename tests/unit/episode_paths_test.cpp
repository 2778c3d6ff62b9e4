#include "internal/fs/episode_paths.hpp"

#include <cassert>
#include <iostream>

#include "internal/model/status.hpp"

namespace {

void TestParseEpisodeIndex() {
  assert(curator::fs::ParseEpisodeIndex("episode_000042.parquet") == 42);
  assert(curator::fs::ParseEpisodeIndex("/a/b/chunk-000/episode_000000.parquet") == 0);
  assert(curator::fs::ParseEpisodeIndex("episode_1234567.mp4") == 1234567);
  assert(curator::fs::ParseEpisodeIndex("my_episode_7.parquet") == 7);
}

void TestUnparseableNames() {
  assert(!curator::fs::ParseEpisodeIndex("episode_.parquet"));
  assert(!curator::fs::ParseEpisodeIndex("episode_abc.parquet"));
  assert(!curator::fs::ParseEpisodeIndex("episode_12x.parquet"));
  assert(!curator::fs::ParseEpisodeIndex("episode.parquet"));
  assert(!curator::fs::ParseEpisodeIndex("episode_-1.parquet"));
  assert(!curator::fs::ParseEpisodeIndex("episode_1234567890123456789.parquet"));
}

void TestEpisodeFileName() {
  assert(curator::fs::EpisodeFileName(42, ".mp4") == "episode_000042.mp4");
  assert(curator::fs::EpisodeFileName(1234567, ".parquet") == "episode_1234567.parquet");
}

void TestMatchesEpisodeFile() {
  assert(curator::fs::MatchesEpisodeFile("episode_000001.parquet", ".parquet"));
  assert(curator::fs::MatchesEpisodeFile("episode_abc.parquet", ".parquet"));
  assert(!curator::fs::MatchesEpisodeFile("episode_000001.mp4", ".parquet"));
  assert(!curator::fs::MatchesEpisodeFile("meta.parquet", ".parquet"));
  assert(!curator::fs::MatchesEpisodeFile("episode_.parquet.tmp", ".parquet"));
}

void TestStatusNames() {
  using curator::model::Status;
  for (auto status : curator::model::kAllStatuses) {
    assert(curator::model::StatusFromString(curator::model::ToString(status)) == status);
  }
  assert(curator::model::ToString(Status::kMissingSide) == "MISSING_SIDE");
  assert(!curator::model::StatusFromString("missing_side"));

  assert(!curator::model::IsActionable(Status::kUnchanged));
  assert(curator::model::IsActionable(Status::kDeleted));
  assert(curator::model::IsActionable(Status::kPending));
  assert(!curator::model::IsTrajectoryBearing(Status::kOrphanVideo));
  assert(!curator::model::IsTrajectoryBearing(Status::kDeleted));
  assert(curator::model::IsTrajectoryBearing(Status::kError));
}

} // namespace

int main() {
  TestParseEpisodeIndex();
  TestUnparseableNames();
  TestEpisodeFileName();
  TestMatchesEpisodeFile();
  TestStatusNames();

  std::cout << "curator_unit_episode_paths: pass\n";
  return 0;
}
