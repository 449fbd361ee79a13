#pragma once

#include <cstddef>

#include "config/config.pb.h"
#include "internal/model/network_model.hpp"
#include "internal/selection/selection_result.hpp"
#include "internal/solver/ip_backend.hpp"

namespace trustnet::selection {

struct SentinelSelection {
  SelectionResult exact;
  SelectionResult greedy;
  SelectionResult naive;

  std::size_t candidate_count{0};
  std::size_t talent_count{0};
};

/*
  Sentinel Selector (Maximum Coverage).

  Runs the exact, greedy and naive methods over the same candidate set. The
  exact method degrades to the greedy ids when the backend is missing, times
  out or cannot handle the program.

  Throws util::ConfigurationError at construction for a non-positive budget.
*/
class SentinelSelector {
 public:
  SentinelSelector(trustnet::runtime::config::SentinelConfig config,
                   trustnet::runtime::config::SolverConfig solver_config,
                   solver::IntegerProgramBackendPtr backend);

  SentinelSelection Select(const model::NetworkModel& network) const;

 private:
  trustnet::runtime::config::SentinelConfig config_;
  trustnet::runtime::config::SolverConfig   solver_config_;
  solver::IntegerProgramBackendPtr          backend_;
};

} // namespace trustnet::selection
