#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using trailmap::observability::IntField;
using trailmap::observability::StringField;

namespace {

constexpr int kExitClean  = 0;
constexpr int kExitUsage  = 1;
constexpr int kExitFatal  = 2;
constexpr int kExitCycles = 3;

void PrintUsage() {
  std::cerr << "Usage: trailmap-audit --config <config.yaml> [--project <id>]..." << std::endl;
}

void Shutdown() {
  trailmap::observability::ShutdownLogging();
  trailmap::observability::ShutdownMetrics();
  trailmap::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> projects;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--project" && i + 1 < argc) {
      projects.emplace_back(argv[++i]);
    } else {
      PrintUsage();
      return kExitUsage;
    }
  }
  if (config_path.empty()) {
    PrintUsage();
    return kExitUsage;
  }

  trailmap::observability::InitializeDefaultLogging();

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = trailmap::config::ConfigLoader::LoadFromYaml(config_path);

    trailmap::observability::InitializeTracing(config);
    trailmap::observability::InitializeMetrics(config);
    trailmap::observability::InitializeLogging(config);

    auto runtime = trailmap::factory::Build(config);

    // ------------------------------------------------------------
    // Pick projects: command line, then config, then everything
    // ------------------------------------------------------------
    if (projects.empty()) {
      projects.assign(config.audit().projects().begin(), config.audit().projects().end());
    }
    if (projects.empty()) {
      projects = runtime.curriculum->Projects();
    }

    std::size_t cycle_count = 0;
    for (const auto& project_id : projects) {
      const auto cycles = runtime.dependencies->DetectCycles(project_id);
      cycle_count += cycles.size();
      TRAILMAP_LOG_INFO("Project audited", {StringField("project_id", project_id), IntField("cycles", static_cast<std::int64_t>(cycles.size()))});
    }

    TRAILMAP_LOG_INFO("Audit finished", {IntField("projects", static_cast<std::int64_t>(projects.size())),
                                         IntField("cycles", static_cast<std::int64_t>(cycle_count))});
    Shutdown();
    return cycle_count == 0 ? kExitClean : kExitCycles;
  } catch (const std::exception& e) {
    TRAILMAP_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return kExitFatal;
  }
}
