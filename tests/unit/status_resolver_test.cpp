#include "internal/discovery/status_resolver.hpp"

#include <cassert>
#include <iostream>

namespace {

using curator::discovery::EpisodeObservation;
using curator::discovery::StatusResolver;
using curator::model::ManifestRow;
using curator::model::Status;

constexpr const char* kAlgo = "size+mtime+sha256(head|tail:65536)-v1";

EpisodeObservation CompleteEpisode(const std::string& fingerprint = "fp-1") {
  EpisodeObservation obs;
  obs.chunk                = "000";
  obs.observed_at          = "2024-05-01T00:00:00.000000Z";
  obs.episode_index        = 7;
  obs.trajectory.path      = "/d/data/chunk-000/episode_000007.parquet";
  obs.trajectory.exists    = true;
  obs.front.path           = "/d/videos/chunk-000/observation.images.front/episode_000007.mp4";
  obs.front.exists         = true;
  obs.wrist.path           = "/d/videos/chunk-000/observation.images.wrist/episode_000007.mp4";
  obs.wrist.exists         = true;
  obs.fingerprint          = fingerprint;
  obs.bytes_total          = 300;
  return obs;
}

ManifestRow Previous(const std::string& fingerprint, const std::string& algo = kAlgo) {
  ManifestRow row;
  row.chunk            = "000";
  row.episode_index    = 7;
  row.fingerprint      = fingerprint;
  row.fingerprint_algo = algo;
  row.status           = Status::kNew;
  return row;
}

void TestNewUnchangedChanged() {
  StatusResolver resolver(kAlgo);
  const auto     obs = CompleteEpisode("fp-1");

  assert(resolver.Resolve(obs, nullptr) == Status::kNew);

  const auto same = Previous("fp-1");
  assert(resolver.Resolve(obs, &same) == Status::kUnchanged);

  const auto other = Previous("fp-0");
  assert(resolver.Resolve(obs, &other) == Status::kChanged);

  // a previous row without a fingerprint counts as never seen
  auto unfingerprinted = Previous("fp-1");
  unfingerprinted.fingerprint.reset();
  assert(resolver.Resolve(obs, &unfingerprinted) == Status::kNew);
}

void TestUnsettledPreviousIsNew() {
  StatusResolver resolver(kAlgo);
  const auto     obs = CompleteEpisode("fp-1");

  // the file settled with the same bytes it had while still being written
  auto pending   = Previous("fp-1");
  pending.status = Status::kPending;
  assert(resolver.Resolve(obs, &pending) == Status::kNew);

  auto failed   = Previous("fp-1");
  failed.status = Status::kError;
  assert(resolver.Resolve(obs, &failed) == Status::kNew);

  auto incomplete   = Previous("fp-1");
  incomplete.status = Status::kMissingSide;
  assert(resolver.Resolve(obs, &incomplete) == Status::kUnchanged);
}

void TestAlgorithmChangeIsChanged() {
  StatusResolver resolver(kAlgo);
  const auto     obs  = CompleteEpisode("fp-1");
  const auto     prev = Previous("fp-1", "size+mtime+sha256(full)-v1");
  assert(resolver.Resolve(obs, &prev) == Status::kChanged);
}

void TestMissingSide() {
  StatusResolver resolver(kAlgo);
  auto           obs = CompleteEpisode();
  obs.wrist.exists   = false;
  assert(resolver.Resolve(obs, nullptr) == Status::kMissingSide);

  // even when the previous fingerprint matches
  const auto prev = Previous(*obs.fingerprint);
  assert(resolver.Resolve(obs, &prev) == Status::kMissingSide);

  const auto row = resolver.BuildRow(obs, nullptr, obs.observed_at);
  assert(row.exists_front && !row.exists_wrist);
  assert(row.video_front_uri && !row.video_wrist_uri);
  assert(row.fingerprint == obs.fingerprint);
}

void TestPendingBeatsMissingSide() {
  StatusResolver resolver(kAlgo);
  auto           obs = CompleteEpisode();
  obs.wrist.exists   = false;
  obs.front.stable   = false;
  assert(resolver.Resolve(obs, nullptr) == Status::kPending);

  // a missing file is never "unstable"
  auto missing          = CompleteEpisode();
  missing.wrist.exists  = false;
  missing.wrist.stable  = false;
  assert(resolver.Resolve(missing, nullptr) == Status::kMissingSide);
}

void TestErrorBeatsPending() {
  StatusResolver resolver(kAlgo);
  auto           obs    = CompleteEpisode();
  obs.trajectory.stable = false;
  obs.fingerprint.reset();
  obs.error = R"({"reason":"fingerprint_failed"})";
  assert(resolver.Resolve(obs, nullptr) == Status::kError);

  const auto row = resolver.BuildRow(obs, nullptr, obs.observed_at);
  assert(row.status == Status::kError);
  assert(row.errors == obs.error);
  assert(!row.fingerprint);
  assert(row.bytes_total == 0);
}

void TestUnparsedIndexIsError() {
  StatusResolver resolver(kAlgo);
  auto           obs = CompleteEpisode();
  obs.episode_index.reset();
  obs.error = R"({"reason":"bad_episode_name"})";

  const auto row = resolver.BuildRow(obs, nullptr, obs.observed_at);
  assert(row.status == Status::kError);
  assert(row.episode_index == curator::model::kUnparsedEpisodeIndex);
  assert(row.parquet_uri == obs.trajectory.path.string());
}

void TestBuildRowCarriesFields() {
  StatusResolver resolver(kAlgo);
  const auto     obs = CompleteEpisode();
  const auto     row = resolver.BuildRow(obs, nullptr, "2024-06-01T00:00:00.000000Z");

  assert(row.status == Status::kNew);
  assert(row.chunk == "000" && row.episode_index == 7);
  assert(row.fingerprint_algo == kAlgo);
  assert(row.discovered_at == "2024-06-01T00:00:00.000000Z");
  assert(row.bytes_total == 300);
  assert(!row.errors);
}

} // namespace

int main() {
  TestNewUnchangedChanged();
  TestUnsettledPreviousIsNew();
  TestAlgorithmChangeIsChanged();
  TestMissingSide();
  TestPendingBeatsMissingSide();
  TestErrorBeatsPending();
  TestUnparsedIndexIsError();
  TestBuildRowCarriesFields();

  std::cout << "curator_unit_status_resolver: pass\n";
  return 0;
}
