#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/export/result_exporter.hpp"
#include "internal/selection/maintenance_selector.hpp"
#include "internal/selection/sentinel_selector.hpp"
#include "internal/solver/ip_backend.hpp"

namespace trustnet::factory {

/*
  Application

  Long-lived components of one optimizer run. The selectors share the
  backend; nothing here holds mutable state between runs.
*/
struct Application {
  solver::IntegerProgramBackendPtr backend;

  std::shared_ptr<selection::SentinelSelector>    sentinel_selector;
  std::shared_ptr<selection::MaintenanceSelector> maintenance_selector;
  std::shared_ptr<exporter::ResultExporter>       exporter;
};

/*
  Build

  Constructs every component from the runtime config. Throws
  util::ConfigurationError before anything runs when a section is invalid.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know the concrete backend type.
*/
Application Build(const trustnet::runtime::config::RuntimeConfig& config);

} // namespace trustnet::factory
