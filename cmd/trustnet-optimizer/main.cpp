#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/pipeline.hpp"

using trustnet::factory::Build;
using trustnet::runtime::Pipeline;

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: trustnet-optimizer <config.yaml> OR trustnet-optimizer --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = trustnet::config::ConfigLoader::LoadFromYaml(config_path);

    trustnet::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (validates every section first)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    Pipeline pipeline(config, std::move(app));
    pipeline.Run();

    TRUSTNET_LOG_INFO("Optimizer finished", {trustnet::observability::StringField("output_dir", config.output().output_dir())});
    trustnet::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TRUSTNET_LOG_ERROR("Fatal error", {trustnet::observability::StringField("error", e.what())});
    trustnet::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
