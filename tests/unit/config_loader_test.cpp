#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "curator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
discovery:
  data_root: /data/episodes
  manifest_path: /data/manifest.parquet
  workers: 8
  since: "2024-05-01T00:00:00Z"
  full_hash: true
  only_chunks: ["000", "017"]
fingerprint:
  sample_bytes: 4096
stability:
  min_bytes: 1024
  pause_ms: 20
layout:
  trajectory_extension: .parquet
  front_camera_dir: cam_front
  wrist_camera_dir: cam_wrist
)");

  auto config = curator::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.discovery().data_root() == "/data/episodes");
  assert(config.discovery().workers() == 8);
  assert(config.discovery().full_hash());
  assert(config.fingerprint().sample_bytes() == 4096);
  assert(config.stability().pause_ms() == 20);
  assert(config.layout().front_camera_dir() == "cam_front");

  // quoted chunk ids must not turn into numbers
  assert(config.discovery().only_chunks_size() == 2);
  assert(config.discovery().only_chunks(0) == "000");
  assert(config.discovery().only_chunks(1) == "017");
}

void TestQuotedBackslashValues() {
  auto config = curator::config::ConfigLoader::LoadFromYamlString(R"(discovery:
  data_root: "C:\\episodes\\\"quoted\"\\root"
)");
  assert(config.discovery().data_root() == "C:\\episodes\\\"quoted\"\\root");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = curator::config::ConfigLoader::LoadFromYamlString("");
  assert(config.discovery().workers() == 0);
  assert(config.discovery().only_chunks_size() == 0);

  const auto settings = curator::factory::BuildSettings(config);
  assert(settings.layout.front_camera_dir == "observation.images.front");
  assert(settings.layout.wrist_camera_dir == "observation.images.wrist");
  assert(settings.fingerprinter.sample_bytes() == curator::fingerprint::Fingerprinter::kDefaultSampleBytes);
  assert(settings.stability.min_bytes() == curator::fingerprint::StabilityChecker::kDefaultMinBytes);

  const auto options = curator::factory::BuildOptions(config);
  assert(options.workers == 16);
  assert(!options.since.has_value());
}

void TestFactoryAppliesOverrides() {
  auto config = curator::config::ConfigLoader::LoadFromYamlString(R"(discovery:
  data_root: /d
  manifest_path: /m.parquet
  workers: 3
  since: "1700000000000000000"
stability:
  min_bytes: 10
  pause_ms: 5
)");

  const auto options = curator::factory::BuildOptions(config);
  assert(options.data_root == "/d");
  assert(options.workers == 3);
  assert(options.since.has_value());
  assert(curator::util::ToUnixNanos(*options.since) == 1700000000000000000LL);

  const auto settings = curator::factory::BuildSettings(config);
  assert(settings.stability.min_bytes() == 10);
  assert(settings.stability.pause() == std::chrono::milliseconds(5));
}

void TestBadSinceIsRejected() {
  auto config = curator::config::ConfigLoader::LoadFromYamlString(R"(discovery:
  since: yesterday
)");

  bool threw = false;
  try {
    (void)curator::factory::BuildOptions(config);
  } catch (const curator::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "BuildOptions must reject unparseable timestamps.");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(discovery:
  data_root: /data
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)curator::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)curator::config::ConfigLoader::LoadFromYaml("/nonexistent/curator.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestQuotedBackslashValues();
  TestEmptyDocumentYieldsDefaults();
  TestFactoryAppliesOverrides();
  TestBadSinceIsRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "curator_unit_config_loader: pass\n";
  return 0;
}
