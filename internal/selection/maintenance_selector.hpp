#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/model/network_model.hpp"
#include "internal/selection/engagement_model.hpp"
#include "internal/selection/selection_result.hpp"
#include "internal/solver/ip_backend.hpp"

namespace trustnet::selection {

struct MaintenanceSelection {
  SelectionResult exact;
  SelectionResult approximate;

  // Ascending id.
  std::vector<MaintenanceCandidate> candidates;

  // nullptr when `id` was not a candidate.
  const MaintenanceCandidate* Find(model::NodeId id) const;
};

/*
  Maintenance Selector (budgeted 0/1 knapsack over dormant relationships).

  Throws util::ConfigurationError at construction for a non-positive time
  budget or an inconsistent value/cost model.
*/
class MaintenanceSelector {
 public:
  MaintenanceSelector(trustnet::runtime::config::MaintenanceConfig config,
                      trustnet::runtime::config::SolverConfig solver_config,
                      solver::IntegerProgramBackendPtr backend);

  MaintenanceSelection Select(const model::NetworkModel& network) const;

 private:
  trustnet::runtime::config::MaintenanceConfig config_;
  trustnet::runtime::config::SolverConfig      solver_config_;
  solver::IntegerProgramBackendPtr             backend_;
  EngagementModel                              engagement_;
};

} // namespace trustnet::selection
