#pragma once

#include "config/config.pb.h"

namespace trustnet::config {

/*
  Startup validation. Each function throws util::ConfigurationError on the
  first invalid setting it finds.
*/

void ValidateInputConfig(const trustnet::runtime::config::InputConfig& cfg);
void ValidateSentinelConfig(const trustnet::runtime::config::SentinelConfig& cfg);
void ValidateMaintenanceConfig(const trustnet::runtime::config::MaintenanceConfig& cfg);

// Validates every section. Called once before any input is read.
void ValidateConfig(const trustnet::runtime::config::RuntimeConfig& config);

} // namespace trustnet::config
