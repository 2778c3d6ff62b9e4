#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "curator/discovery/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using namespace curator::discovery::v1;
using curator::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  curator-discover <config.yaml> [flags]\n"
            << "  curator-discover --config <config.yaml> [flags]\n"
            << "  curator-discover --data-root <dir> --manifest <file> [flags]\n"
            << "\n"
            << "Flags (override the config file):\n"
            << "  --data-root <dir>\n"
            << "  --manifest <file>\n"
            << "  --workers <n>\n"
            << "  --since <ISO-8601 UTC | unix nanos>\n"
            << "  --full-hash\n"
            << "  --chunk <id>        repeatable\n";
}

struct CommandLine {
  std::string              config_path;
  std::string              data_root;
  std::string              manifest_path;
  std::string              workers;
  std::string              since;
  bool                     full_hash = false;
  std::vector<std::string> chunks;
};

static bool Parse(int argc, char** argv, CommandLine& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&](std::string& target) {
      if (i + 1 >= argc) return false;
      target = argv[++i];
      return true;
    };

    if (arg == "--config") {
      if (!value(out.config_path)) return false;
    } else if (arg == "--data-root") {
      if (!value(out.data_root)) return false;
    } else if (arg == "--manifest") {
      if (!value(out.manifest_path)) return false;
    } else if (arg == "--workers") {
      if (!value(out.workers)) return false;
    } else if (arg == "--since") {
      if (!value(out.since)) return false;
    } else if (arg == "--full-hash") {
      out.full_hash = true;
    } else if (arg == "--chunk") {
      std::string chunk;
      if (!value(chunk)) return false;
      out.chunks.push_back(std::move(chunk));
    } else if (!arg.empty() && arg[0] != '-' && out.config_path.empty()) {
      out.config_path = arg;
    } else {
      return false;
    }
  }

  return !out.config_path.empty() || (!out.data_root.empty() && !out.manifest_path.empty());
}

static bool ParseWorkers(const std::string& text, long long& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  out       = std::strtoll(text.c_str(), &end, 10);
  return end != nullptr && *end == '\0';
}

int main(int argc, char** argv) {
  CommandLine args;
  long long   workers = 0;
  if (!Parse(argc, argv, args) || (!args.workers.empty() && !ParseWorkers(args.workers, workers))) {
    Usage();
    return 1;
  }

  curator::runtime::config::RuntimeConfig config;

  try {
    // ------------------------------------------------------------
    // Load configuration, then apply flag overrides
    // ------------------------------------------------------------
    if (!args.config_path.empty()) {
      config = curator::config::ConfigLoader::LoadFromYaml(args.config_path);
    }

    auto* discovery = config.mutable_discovery();
    if (!args.data_root.empty()) discovery->set_data_root(args.data_root);
    if (!args.manifest_path.empty()) discovery->set_manifest_path(args.manifest_path);
    if (!args.since.empty()) discovery->set_since(args.since);
    if (args.full_hash) discovery->set_full_hash(true);
    if (!args.chunks.empty()) {
      discovery->clear_only_chunks();
      for (const auto& chunk : args.chunks) discovery->add_only_chunks(chunk);
    }

    curator::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build and run
    // ------------------------------------------------------------
    auto options = curator::factory::BuildOptions(config);
    if (!args.workers.empty()) options.workers = workers;

    const DiscoveryOrchestrator orchestrator(curator::factory::BuildSettings(config));
    const auto                  report = orchestrator.Run(options);

    // ------------------------------------------------------------
    // Summary
    // ------------------------------------------------------------
    std::cout << "manifest: " << options.manifest_path.string() << "\n"
              << "rows: " << report.manifest_rows << "\n"
              << "actionable: " << report.actionable.size() << "\n";
    for (const auto status : kAllStatuses) {
      auto it = report.status_counts.find(status);
      std::cout << "  " << ToString(status) << ": " << (it == report.status_counts.end() ? 0 : it->second) << "\n";
    }

    curator::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CURATOR_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    curator::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
