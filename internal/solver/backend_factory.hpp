#pragma once

#include "config/config.pb.h"
#include "internal/solver/ip_backend.hpp"

namespace trustnet::solver {

class BackendFactory {
 public:
  // nullptr for SOLVER_BACKEND_NONE: the selectors then only run their approximate methods.
  static IntegerProgramBackendPtr Build(const trustnet::runtime::config::SolverConfig& cfg);
};

} // namespace trustnet::solver
